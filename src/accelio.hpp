// ============================================================================
// accelio.hpp - Wearable accelerometer file decoding with day windowing
// ============================================================================
#pragma once
#include "data/window_spec.hpp"
#include "data/day_windower.hpp"
#include "data/sample_stream.hpp"
#include "io/read_error.hpp"
#include "io/device_metadata.hpp"
#include "io/reader_common.hpp"
#include "io/axivity_reader.hpp"
#include "io/geneactiv_reader.hpp"
#include "io/actigraph_reader.hpp"
#include "io/device_reader.hpp"
#include "utils/config_parser.hpp"
#include "utils/log.hpp"
