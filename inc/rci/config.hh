#pragma once

#include <cstdint>

// debug configs: enable/disable to turn on/off specific debug features
#ifndef RCI_CONFIG_LOG_COMPACTION
#define RCI_CONFIG_LOG_COMPACTION               (0)
#endif
#ifndef RCI_CONFIG_CHECK_REFCOUNT_OVERFLOW
#define RCI_CONFIG_CHECK_REFCOUNT_OVERFLOW      (1)
#endif

// limits
#ifndef RCI_CONFIG_MAX_STRONG_COUNT
#define RCI_CONFIG_MAX_STRONG_COUNT             (SIZE_MAX / 2)
#endif
