#pragma once

#include <webgpu.h>
#include <wgpu.h>
#include <string>
#include <cstddef>

struct Uniforms {
    float projection[16];
    float viewportW;
    float viewportH;
    float pixelRatio;   // physical pixels per logical pixel
    float _pad;
};

// Line segment instance: endpoints in plot space, RGBA, width in pixels.
struct LineInstance {
    float x0, y0;
    float x1, y1;
    float r, g, b, a;
    float width;
};

// Band vertex: x in plot space, y already in clip space, plus a pixel offset
// along x so hairlines stay one pixel wide at any zoom.
struct BandVertex {
    float x, yClip;
    float pixelOffset;
    float r, g, b, a;
};

// Device, shaders and pipelines shared by the plot canvas.
// Owned by MainFrame; the canvas borrows it.
class WebGPUContext {
public:
    WebGPUContext();
    ~WebGPUContext();

    bool Initialize();
    bool IsInitialized() const { return m_initialized; }
    const std::string& GetErrorMessage() const { return m_errorMessage; }

    WGPUInstance GetInstance() const { return m_instance; }
    WGPUAdapter GetAdapter() const { return m_adapter; }
    WGPUDevice GetDevice() const { return m_device; }
    WGPUQueue GetQueue() const { return m_queue; }

    // Corner buffer for instanced line quads (6 vertices)
    WGPUBuffer GetCornerBuffer() const { return m_cornerBuffer; }

    // Builds the line and band pipelines for a surface format (rebuilt if it changes)
    bool PreparePipelines(WGPUTextureFormat format);
    WGPURenderPipeline GetLinePipeline() const { return m_linePipeline; }
    WGPURenderPipeline GetBandPipeline() const { return m_bandPipeline; }

    // Caller owns the returned objects. Null for empty data.
    WGPUBuffer CreateVertexBuffer(const void* data, size_t bytes, const char* label);
    WGPUBindGroup CreateUniformBindGroup(WGPUBuffer uniformBuffer);

private:
    bool RequestAdapterAndDevice();
    void CreateSharedResources();
    void ReleasePipelines();
    void Cleanup();

    WGPUInstance m_instance = nullptr;
    WGPUAdapter m_adapter = nullptr;
    WGPUDevice m_device = nullptr;
    WGPUQueue m_queue = nullptr;

    WGPUBuffer m_cornerBuffer = nullptr;
    WGPUShaderModule m_shaderModule = nullptr;
    WGPUBindGroupLayout m_bindGroupLayout = nullptr;
    WGPUPipelineLayout m_pipelineLayout = nullptr;

    WGPUTextureFormat m_pipelineFormat = WGPUTextureFormat_Undefined;
    WGPURenderPipeline m_linePipeline = nullptr;
    WGPURenderPipeline m_bandPipeline = nullptr;

    std::string m_errorMessage;
    bool m_initialized = false;
};
