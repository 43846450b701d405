// Copyright 2025 Jonas Teuwen. All Rights Reserved.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef SLIDEPATCH_INCLUDE_SLIDEPATCH_SLIDEPATCH_H_
#define SLIDEPATCH_INCLUDE_SLIDEPATCH_SLIDEPATCH_H_

/**
 * @file slidepatch.h
 * @brief Main header for the slidepatch library
 *
 * slidepatch turns whole-slide images into tissue patches:
 * - **Readers**: pyramidal TIFF/SVS and PNG slides behind SlideReader
 * - **Masking**: tissue masks on a low-resolution overview
 * - **Tiling**: patch grid, mask coordinate mapping and coverage filtering
 * - **Pipeline**: per-slide extraction and batch processing
 *
 * @see slidepatch/pipeline/patch_extractor.h for the entry point
 */

// ============================================================================
// Core
// ============================================================================

#include "slidepatch/core/slide_descriptor.h"
#include "slidepatch/core/tile.h"
#include "slidepatch/errors.h"
#include "slidepatch/image.h"
#include "slidepatch/slide_reader.h"

// ============================================================================
// Readers
// ============================================================================

#include "slidepatch/readers/memory_reader.h"
#include "slidepatch/readers/png_reader.h"
#include "slidepatch/readers/tiff_reader.h"
#include "slidepatch/runtime/reader_registry.h"

// ============================================================================
// Masking and tiling
// ============================================================================

#include "slidepatch/masking/masking_registry.h"
#include "slidepatch/masking/morphology.h"
#include "slidepatch/masking/polygon_mask.h"
#include "slidepatch/masking/tissue_mask.h"
#include "slidepatch/tiling/coordinate_mapper.h"
#include "slidepatch/tiling/coverage_filter.h"
#include "slidepatch/tiling/tile_grid.h"

// ============================================================================
// Pipeline
// ============================================================================

#include "slidepatch/pipeline/batch.h"
#include "slidepatch/pipeline/extraction_config.h"
#include "slidepatch/pipeline/manifest.h"
#include "slidepatch/pipeline/patch_extractor.h"

#endif  // SLIDEPATCH_INCLUDE_SLIDEPATCH_SLIDEPATCH_H_
