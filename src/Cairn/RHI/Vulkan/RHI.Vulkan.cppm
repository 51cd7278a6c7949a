export module RHI.Vulkan;

// Vulkan implementation of the RHI device seam.
export import :Convert;
export import :Context;
export import :Device;
export import :CommandUtils;
export import :Buffer;
export import :Image;
export import :Sampler;
export import :Shader;
export import :Descriptors;
export import :Pipeline;
export import :Swapchain;
export import :Recorder;
export import :Backend;
