#include "WebGPUContext.h"
#include <cstdio>
#include <cstddef>
#include <string>

// Plot shaders: instanced line segments expanded in pixel space, and
// full-height bands whose x is in plot space.
static const char* kPlotShaderSource = R"(
struct Uniforms {
    projection: mat4x4f,
    viewport_w: f32,
    viewport_h: f32,
    pixel_ratio: f32,
    _pad: f32,
}

@group(0) @binding(0) var<uniform> uniforms: Uniforms;

struct VertexOutput {
    @builtin(position) position: vec4f,
    @location(0) color: vec4f,
}

@vertex
fn line_vs(
    @location(0) corner: vec2f,
    @location(1) p0: vec2f,
    @location(2) p1: vec2f,
    @location(3) color: vec4f,
    @location(4) width: f32,
) -> VertexOutput {
    let half_vp = vec2f(uniforms.viewport_w, uniforms.viewport_h) * 0.5;
    let c0 = uniforms.projection * vec4f(p0, 0.0, 1.0);
    let c1 = uniforms.projection * vec4f(p1, 0.0, 1.0);
    let s0 = c0.xy * half_vp;
    let s1 = c1.xy * half_vp;

    var dir = s1 - s0;
    let len = length(dir);
    if (len < 0.0001) {
        dir = vec2f(1.0, 0.0);
    } else {
        dir = dir / len;
    }
    let normal = vec2f(-dir.y, dir.x);
    let pixel = mix(s0, s1, corner.x) + normal * corner.y * width * uniforms.pixel_ratio;

    var output: VertexOutput;
    output.position = vec4f(pixel / half_vp, 0.0, 1.0);
    output.color = color;
    return output;
}

@vertex
fn band_vs(
    @location(0) pos: vec2f,
    @location(1) pixel_offset: f32,
    @location(2) color: vec4f,
) -> VertexOutput {
    let clip = uniforms.projection * vec4f(pos.x, 0.0, 0.0, 1.0);
    var output: VertexOutput;
    output.position = vec4f(clip.x + pixel_offset * uniforms.pixel_ratio * 2.0 / uniforms.viewport_w, pos.y, 0.0, 1.0);
    output.color = color;
    return output;
}

@fragment
fn color_fs(input: VertexOutput) -> @location(0) vec4f {
    return input.color;
}
)";

static std::string viewToString(WGPUStringView view) {
    if (!view.data) return {};
    if (view.length == WGPU_STRLEN) return std::string(view.data);
    return std::string(view.data, view.length);
}

static void onAdapterReady(WGPURequestAdapterStatus status, WGPUAdapter adapter,
                           WGPUStringView message, void* ud1, void* ud2) {
    if (status == WGPURequestAdapterStatus_Success) {
        *static_cast<WGPUAdapter*>(ud1) = adapter;
        return;
    }
    auto* error = static_cast<std::string*>(ud2);
    *error = "No suitable GPU adapter: " + viewToString(message);
}

static void onDeviceReady(WGPURequestDeviceStatus status, WGPUDevice device,
                          WGPUStringView message, void* ud1, void* ud2) {
    if (status == WGPURequestDeviceStatus_Success) {
        *static_cast<WGPUDevice*>(ud1) = device;
        return;
    }
    auto* error = static_cast<std::string*>(ud2);
    *error = "GPU device request failed: " + viewToString(message);
}

// Validation and out-of-memory errors outside any error scope
static void onUncapturedError(WGPUDevice const* device, WGPUErrorType type,
                              WGPUStringView message, void* ud1, void* ud2) {
    (void)device; (void)ud1; (void)ud2;
    fprintf(stderr, "WebGPU error (%d): %s\n", static_cast<int>(type),
            viewToString(message).c_str());
}

WebGPUContext::WebGPUContext() = default;

WebGPUContext::~WebGPUContext() {
    Cleanup();
}

bool WebGPUContext::Initialize() {
    m_errorMessage.clear();

    m_instance = wgpuCreateInstance(nullptr);
    if (!m_instance) {
        m_errorMessage = "Could not create a WebGPU instance";
        fprintf(stderr, "%s\n", m_errorMessage.c_str());
        return false;
    }

    if (!RequestAdapterAndDevice()) {
        fprintf(stderr, "%s\n", m_errorMessage.c_str());
        Cleanup();
        return false;
    }

    m_queue = wgpuDeviceGetQueue(m_device);
    CreateSharedResources();

    m_initialized = true;
    fprintf(stderr, "WebGPU context initialized\n");
    return true;
}

// Both requests complete synchronously on wgpu-native
bool WebGPUContext::RequestAdapterAndDevice() {
    WGPURequestAdapterOptions opts = {};
    opts.powerPreference = WGPUPowerPreference_LowPower;
    WGPURequestAdapterCallbackInfo adapterCb = {};
    adapterCb.callback = onAdapterReady;
    adapterCb.userdata1 = &m_adapter;
    adapterCb.userdata2 = &m_errorMessage;
    wgpuInstanceRequestAdapter(m_instance, &opts, adapterCb);
    if (!m_adapter) {
        if (m_errorMessage.empty()) m_errorMessage = "No suitable GPU adapter";
        return false;
    }

    WGPUDeviceDescriptor deviceDesc = {};
    deviceDesc.label = {"tracemark_device", WGPU_STRLEN};
    deviceDesc.uncapturedErrorCallbackInfo.callback = onUncapturedError;

    WGPURequestDeviceCallbackInfo deviceCb = {};
    deviceCb.callback = onDeviceReady;
    deviceCb.userdata1 = &m_device;
    deviceCb.userdata2 = &m_errorMessage;
    wgpuAdapterRequestDevice(m_adapter, &deviceDesc, deviceCb);
    if (!m_device) {
        if (m_errorMessage.empty()) m_errorMessage = "GPU device request failed";
        return false;
    }
    return true;
}

void WebGPUContext::CreateSharedResources() {
    // Segment quad: x runs along the segment (0..1), y across it (-0.5..0.5)
    const float corners[] = {
        0.0f, -0.5f,  1.0f, -0.5f,  1.0f, 0.5f,
        0.0f, -0.5f,  1.0f,  0.5f,  0.0f, 0.5f,
    };
    m_cornerBuffer = CreateVertexBuffer(corners, sizeof(corners), "segment_corners");

    WGPUShaderSourceWGSL wgsl = {};
    wgsl.chain.sType = WGPUSType_ShaderSourceWGSL;
    wgsl.code = {kPlotShaderSource, WGPU_STRLEN};
    WGPUShaderModuleDescriptor moduleDesc = {};
    moduleDesc.label = {"plot_shaders", WGPU_STRLEN};
    moduleDesc.nextInChain = &wgsl.chain;
    m_shaderModule = wgpuDeviceCreateShaderModule(m_device, &moduleDesc);

    // One uniform block shared by every pipeline
    WGPUBindGroupLayoutEntry uniformEntry = {};
    uniformEntry.binding = 0;
    uniformEntry.visibility = WGPUShaderStage_Vertex;
    uniformEntry.buffer.type = WGPUBufferBindingType_Uniform;
    uniformEntry.buffer.minBindingSize = sizeof(Uniforms);

    WGPUBindGroupLayoutDescriptor layoutDesc = {};
    layoutDesc.label = {"uniform_layout", WGPU_STRLEN};
    layoutDesc.entryCount = 1;
    layoutDesc.entries = &uniformEntry;
    m_bindGroupLayout = wgpuDeviceCreateBindGroupLayout(m_device, &layoutDesc);

    WGPUPipelineLayoutDescriptor pipelineLayoutDesc = {};
    pipelineLayoutDesc.label = {"plot_layout", WGPU_STRLEN};
    pipelineLayoutDesc.bindGroupLayoutCount = 1;
    pipelineLayoutDesc.bindGroupLayouts = &m_bindGroupLayout;
    m_pipelineLayout = wgpuDeviceCreatePipelineLayout(m_device, &pipelineLayoutDesc);
}

WGPUBuffer WebGPUContext::CreateVertexBuffer(const void* data, size_t bytes, const char* label) {
    if (!m_device || bytes == 0)
        return nullptr;
    WGPUBufferDescriptor desc = {};
    desc.label = {label, WGPU_STRLEN};
    desc.size = bytes;
    desc.usage = WGPUBufferUsage_Vertex | WGPUBufferUsage_CopyDst;
    WGPUBuffer buffer = wgpuDeviceCreateBuffer(m_device, &desc);
    wgpuQueueWriteBuffer(m_queue, buffer, 0, data, bytes);
    return buffer;
}

WGPUBindGroup WebGPUContext::CreateUniformBindGroup(WGPUBuffer uniformBuffer) {
    WGPUBindGroupEntry entry = {};
    entry.binding = 0;
    entry.buffer = uniformBuffer;
    entry.offset = 0;
    entry.size = sizeof(Uniforms);

    WGPUBindGroupDescriptor desc = {};
    desc.label = {"uniforms", WGPU_STRLEN};
    desc.layout = m_bindGroupLayout;
    desc.entryCount = 1;
    desc.entries = &entry;
    return wgpuDeviceCreateBindGroup(m_device, &desc);
}

bool WebGPUContext::PreparePipelines(WGPUTextureFormat format) {
    if (!m_initialized)
        return false;
    if (m_linePipeline && m_bandPipeline && format == m_pipelineFormat)
        return true;
    ReleasePipelines();

    // Straight alpha over the white background
    WGPUBlendState blend = {};
    blend.color.operation = WGPUBlendOperation_Add;
    blend.color.srcFactor = WGPUBlendFactor_SrcAlpha;
    blend.color.dstFactor = WGPUBlendFactor_OneMinusSrcAlpha;
    blend.alpha.operation = WGPUBlendOperation_Add;
    blend.alpha.srcFactor = WGPUBlendFactor_One;
    blend.alpha.dstFactor = WGPUBlendFactor_OneMinusSrcAlpha;

    WGPUColorTargetState target = {};
    target.format = format;
    target.blend = &blend;
    target.writeMask = WGPUColorWriteMask_All;

    WGPUFragmentState fragment = {};
    fragment.module = m_shaderModule;
    fragment.entryPoint = {"color_fs", WGPU_STRLEN};
    fragment.targetCount = 1;
    fragment.targets = &target;

    // Lines: corner per vertex, segment per instance
    WGPUVertexAttribute cornerAttr = {};
    cornerAttr.format = WGPUVertexFormat_Float32x2;
    cornerAttr.shaderLocation = 0;

    auto attribute = [](WGPUVertexFormat format, size_t offset, uint32_t location) {
        WGPUVertexAttribute attr = {};
        attr.format = format;
        attr.offset = offset;
        attr.shaderLocation = location;
        return attr;
    };

    WGPUVertexAttribute segmentAttrs[4] = {
        attribute(WGPUVertexFormat_Float32x2, offsetof(LineInstance, x0), 1),
        attribute(WGPUVertexFormat_Float32x2, offsetof(LineInstance, x1), 2),
        attribute(WGPUVertexFormat_Float32x4, offsetof(LineInstance, r), 3),
        attribute(WGPUVertexFormat_Float32, offsetof(LineInstance, width), 4),
    };

    WGPUVertexBufferLayout lineBuffers[2] = {};
    lineBuffers[0].stepMode = WGPUVertexStepMode_Vertex;
    lineBuffers[0].arrayStride = 2 * sizeof(float);
    lineBuffers[0].attributeCount = 1;
    lineBuffers[0].attributes = &cornerAttr;
    lineBuffers[1].stepMode = WGPUVertexStepMode_Instance;
    lineBuffers[1].arrayStride = sizeof(LineInstance);
    lineBuffers[1].attributeCount = 4;
    lineBuffers[1].attributes = segmentAttrs;

    WGPURenderPipelineDescriptor desc = {};
    desc.layout = m_pipelineLayout;
    desc.vertex.module = m_shaderModule;
    desc.primitive.topology = WGPUPrimitiveTopology_TriangleList;
    desc.fragment = &fragment;
    desc.multisample.count = 1;
    desc.multisample.mask = 0xFFFFFFFF;

    desc.label = {"line_pipeline", WGPU_STRLEN};
    desc.vertex.entryPoint = {"line_vs", WGPU_STRLEN};
    desc.vertex.bufferCount = 2;
    desc.vertex.buffers = lineBuffers;
    m_linePipeline = wgpuDeviceCreateRenderPipeline(m_device, &desc);

    // Bands: plain triangle list, x in plot space and y in clip space
    WGPUVertexAttribute bandAttrs[3] = {
        attribute(WGPUVertexFormat_Float32x2, offsetof(BandVertex, x), 0),
        attribute(WGPUVertexFormat_Float32, offsetof(BandVertex, pixelOffset), 1),
        attribute(WGPUVertexFormat_Float32x4, offsetof(BandVertex, r), 2),
    };

    WGPUVertexBufferLayout bandBuffer = {};
    bandBuffer.stepMode = WGPUVertexStepMode_Vertex;
    bandBuffer.arrayStride = sizeof(BandVertex);
    bandBuffer.attributeCount = 3;
    bandBuffer.attributes = bandAttrs;

    desc.label = {"band_pipeline", WGPU_STRLEN};
    desc.vertex.entryPoint = {"band_vs", WGPU_STRLEN};
    desc.vertex.bufferCount = 1;
    desc.vertex.buffers = &bandBuffer;
    m_bandPipeline = wgpuDeviceCreateRenderPipeline(m_device, &desc);

    m_pipelineFormat = format;
    if (!m_linePipeline || !m_bandPipeline) {
        fprintf(stderr, "Failed to create plot pipelines\n");
        ReleasePipelines();
        return false;
    }
    return true;
}

void WebGPUContext::ReleasePipelines() {
    if (m_linePipeline) { wgpuRenderPipelineRelease(m_linePipeline); m_linePipeline = nullptr; }
    if (m_bandPipeline) { wgpuRenderPipelineRelease(m_bandPipeline); m_bandPipeline = nullptr; }
    m_pipelineFormat = WGPUTextureFormat_Undefined;
}

void WebGPUContext::Cleanup() {
    ReleasePipelines();
    if (m_pipelineLayout) { wgpuPipelineLayoutRelease(m_pipelineLayout); m_pipelineLayout = nullptr; }
    if (m_bindGroupLayout) { wgpuBindGroupLayoutRelease(m_bindGroupLayout); m_bindGroupLayout = nullptr; }
    if (m_shaderModule) { wgpuShaderModuleRelease(m_shaderModule); m_shaderModule = nullptr; }
    if (m_cornerBuffer) { wgpuBufferRelease(m_cornerBuffer); m_cornerBuffer = nullptr; }
    if (m_queue) { wgpuQueueRelease(m_queue); m_queue = nullptr; }
    if (m_device) { wgpuDeviceRelease(m_device); m_device = nullptr; }
    if (m_adapter) { wgpuAdapterRelease(m_adapter); m_adapter = nullptr; }
    if (m_instance) { wgpuInstanceRelease(m_instance); m_instance = nullptr; }
    m_initialized = false;
}
