export module Cairn;

export import :Types;
export import :Vertex;
export import :Buffer;
export import :Texture;
export import :Sampler;
export import :Shader;
export import :BindGroup;
export import :Pipeline;
export import :Pass;
export import :ResourceStore;
export import :Builders;
export import :FrameExecutor;
export import :Context;
