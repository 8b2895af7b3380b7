/**
 * @file ean13.hpp
 * @brief Header file to facilitate the inclusion of the ean13 library
 * @version 1.0
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

// Include the status codes and symbology constants
#include "enums/error.hpp"
#include "enums/symbology.hpp"
// Include exception hierarchy
#include "exception/ean13_exception.hpp"
// Include the result type
#include "template/result.hpp"
// Include the code value types
#include "code/ean13_code.hpp"
#include "code/module_pattern.hpp"
// Include the checksum and codec
#include "interface/checksum.hpp"
#include "interface/encoding_tables.hpp"
#include "interface/codec.hpp"
// Include the exclusion sets
#include "io/exclusion_set.hpp"
#include "io/memory_exclusion_set.hpp"
#include "io/file_exclusion_set.hpp"
// Include the generator
#include "pattern/constraint_builder.hpp"
#include "pattern/constraint_engine.hpp"
// Include the configuration
#include "pattern/ean13_config.hpp"
// Include the renderers
#include "render/renderer.hpp"
#include "render/ascii_renderer.hpp"
#include "render/svg_renderer.hpp"
