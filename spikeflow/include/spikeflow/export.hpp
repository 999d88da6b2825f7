#pragma once

// Symbol visibility for the spikeflow libraries.
//
// The libraries are built as static archives; SPF_SPIKEFLOW_API and
// SPF_SPIKEFLOWIO_API only matter when building shared objects with hidden
// default visibility.

#if defined(SPF_BUILDING_SHARED)
#   define SPF_SYMBOL_VISIBLE __attribute__((visibility("default")))
#else
#   define SPF_SYMBOL_VISIBLE
#endif

#define SPF_SPIKEFLOW_API SPF_SYMBOL_VISIBLE
#define SPF_SPIKEFLOWIO_API SPF_SYMBOL_VISIBLE
