#pragma once

#include <hashring/core/config.hpp>

#define HASHRING_RLP_NAMESPACE_BEGIN                                           \
    HASHRING_NAMESPACE_BEGIN namespace rlp                                     \
    {

#define HASHRING_RLP_NAMESPACE_END                                             \
    }                                                                          \
    HASHRING_NAMESPACE_END

#define HASHRING_RLP_ANONYMOUS_NAMESPACE_BEGIN                                 \
    HASHRING_RLP_NAMESPACE_BEGIN                                               \
    namespace                                                                  \
    {

#define HASHRING_RLP_ANONYMOUS_NAMESPACE_END                                   \
    }                                                                          \
    HASHRING_RLP_NAMESPACE_END
