#pragma once

// Umbrella header for the relfetch library

#include "relfetch/types.hpp"
#include "relfetch/config.hpp"
#include "relfetch/platform.hpp"
#include "relfetch/progress.hpp"
#include "relfetch/transport.hpp"
#include "relfetch/release_api.hpp"
#include "relfetch/archive.hpp"
#include "relfetch/downloader.hpp"
#include "relfetch/version_record.hpp"
#include "relfetch/installer.hpp"
#include "relfetch/api.hpp"
