#pragma once

#define HASHRING_LIKELY(x) __builtin_expect(!!(x), 1)
#define HASHRING_UNLIKELY(x) __builtin_expect(!!(x), 0)
