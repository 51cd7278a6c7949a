#pragma once

// Every translation unit of the Vulkan backend goes through volk, never the
// loader's prototypes.
#ifndef VK_NO_PROTOTYPES
    #define VK_NO_PROTOTYPES
#endif

#include <volk.h>

// Declarations only. RHI.Vma.cpp owns VMA_IMPLEMENTATION.
#include <vk_mem_alloc.h>

// Logs failed calls through Core::Log; the including unit must import Core.
#ifndef NDEBUG
    #define VK_CHECK(x)                                                                  \
        do {                                                                             \
            VkResult vkCheckResult_ = x;                                                 \
            if (vkCheckResult_ != VK_SUCCESS) {                                          \
                Core::Log::Error("Vulkan Error: {} failed with result {} at {}:{}",      \
                                 #x, static_cast<int>(vkCheckResult_), __FILE__, __LINE__); \
            }                                                                            \
        } while(0)
#else
    #define VK_CHECK(x) (void)(x)
#endif
