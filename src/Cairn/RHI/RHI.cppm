export module RHI;

export import :Types;
export import :Device;
export import :NullDevice;
export import :ShaderCompiler;
