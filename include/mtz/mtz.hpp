#pragma once

#include "mtz/common.hpp"
#include "mtz/error.hpp"
#include "mtz/extra_field.hpp"
#include "mtz/level.hpp"
#include "mtz/log.hpp"
#include "mtz/types.hpp"
#include "mtz/zip_archive.hpp"
