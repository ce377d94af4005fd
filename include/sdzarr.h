#pragma once

#define SDZARR_VERSION_MAJOR 0
#define SDZARR_VERSION_MINOR 1
#define SDZARR_VERSION_PATCH 0
#define SDZARR_VERSION_STRING "0.1.0"

#include "sdzarr_element.h"
#include "sdzarr_element_kind.h"
#include "sdzarr_error_types.h"
#include "sdzarr_gdal_store.h"
#include "sdzarr_metadata.h"
#include "sdzarr_options.h"
#include "sdzarr_resolver.h"
#include "sdzarr_result.h"
#include "sdzarr_schema.h"
#include "sdzarr_spatialdata.h"
#include "sdzarr_store.h"
#include "sdzarr_table.h"
#include "sdzarr_transform.h"
#include "sdzarr_tree.h"
