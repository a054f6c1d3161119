// Tracemark (MIT License) - See LICENSE file
#include "PlotCanvas.h"
#include "DataManager.h"
#include "SeriesStyle.h"
#include <cstdio>
#include <cmath>
#include <cstring>
#include <algorithm>

#ifdef __WXMAC__
#include <Cocoa/Cocoa.h>
#include <QuartzCore/CAMetalLayer.h>
#endif

#ifdef __WXGTK__
#include <gtk/gtk.h>
#include <gdk/gdkx.h>
#endif

#ifdef __WXMSW__
#include <wx/msw/wrapwin.h>
#endif

static constexpr float kDashPx = 4.0f;
static constexpr float kGapPx = 3.0f;
static constexpr int kMaxInitAttempts = 20;

static void makeOrtho(float* m, float left, float right, float bottom, float top) {
    std::memset(m, 0, 16 * sizeof(float));
    m[0]  = 2.0f / (right - left);
    m[5]  = 2.0f / (top - bottom);
    m[10] = -1.0f;
    m[12] = -(right + left) / (right - left);
    m[13] = -(top + bottom) / (top - bottom);
    m[15] = 1.0f;
}

PlotCanvas::PlotCanvas(wxWindow* parent, WebGPUContext* ctx)
    : wxWindow(parent, wxID_ANY, wxDefaultPosition, wxDefaultSize, wxWANTS_CHARS)
    , m_ctx(ctx)
{
    SetBackgroundStyle(wxBG_STYLE_PAINT);

    Bind(wxEVT_PAINT, &PlotCanvas::OnPaint, this);
    Bind(wxEVT_SIZE, &PlotCanvas::OnSize, this);
    Bind(wxEVT_LEFT_DOWN, &PlotCanvas::OnMouse, this);
    Bind(wxEVT_LEFT_UP, &PlotCanvas::OnMouse, this);
    Bind(wxEVT_LEFT_DCLICK, &PlotCanvas::OnMouse, this);
    Bind(wxEVT_MIDDLE_DOWN, &PlotCanvas::OnMouse, this);
    Bind(wxEVT_MIDDLE_UP, &PlotCanvas::OnMouse, this);
    Bind(wxEVT_RIGHT_DOWN, &PlotCanvas::OnMouse, this);
    Bind(wxEVT_RIGHT_UP, &PlotCanvas::OnMouse, this);
    Bind(wxEVT_MOTION, &PlotCanvas::OnMouse, this);
    Bind(wxEVT_MOUSEWHEEL, &PlotCanvas::OnMouse, this);
    Bind(wxEVT_KEY_DOWN, &PlotCanvas::OnKeyDown, this);
    Bind(wxEVT_MOUSE_CAPTURE_LOST, [this](wxMouseCaptureLostEvent&) {
        m_panning = false;
        m_selecting = false;
    });

    CallAfter([this]() { InitSurface(); });
}

PlotCanvas::~PlotCanvas() {
    Cleanup();
}

void PlotCanvas::AddVerticalBand(std::vector<BandVertex>& out, float x0, float x1,
                                 float offset0, float offset1, const float* rgba) {
    BandVertex bl = {x0, -1.0f, offset0, rgba[0], rgba[1], rgba[2], rgba[3]};
    BandVertex br = {x1, -1.0f, offset1, rgba[0], rgba[1], rgba[2], rgba[3]};
    BandVertex tr = {x1,  1.0f, offset1, rgba[0], rgba[1], rgba[2], rgba[3]};
    BandVertex tl = {x0,  1.0f, offset0, rgba[0], rgba[1], rgba[2], rgba[3]};
    out.push_back(bl); out.push_back(br); out.push_back(tr);
    out.push_back(bl); out.push_back(tr); out.push_back(tl);
}

void PlotCanvas::SetSegmentData(const DataSet& data, const RowRange& segment,
                                const std::vector<size_t>& columns,
                                const std::vector<CategoryRun>& runs,
                                const std::vector<size_t>& markerRows) {
    m_xOrigin = static_cast<double>(segment.begin);
    float origin = static_cast<float>(m_xOrigin);

    m_bandVerts.clear();
    for (const auto& run : runs) {
        float rgba[4] = {run.color.r, run.color.g, run.color.b, kBackgroundAlpha};
        float x0 = static_cast<float>(run.first) - origin - 0.5f;
        float x1 = static_cast<float>(run.last) - origin + 0.5f;
        AddVerticalBand(m_bandVerts, x0, x1, 0.0f, 0.0f, rgba);
    }

    // NaN on either end drops the segment, which breaks the polyline
    m_seriesLines.clear();
    for (size_t k = 0; k < columns.size(); k++) {
        size_t col = columns[k];
        if (col >= data.numCols) continue;
        Rgb c = SeriesColor(k);
        for (size_t r = segment.begin; r + 1 < segment.end; r++) {
            float v0 = data.value(r, col);
            float v1 = data.value(r + 1, col);
            if (!std::isfinite(v0) || !std::isfinite(v1)) continue;
            LineInstance li;
            li.x0 = static_cast<float>(r - segment.begin);
            li.y0 = v0;
            li.x1 = static_cast<float>(r + 1 - segment.begin);
            li.y1 = v1;
            li.r = c.r; li.g = c.g; li.b = c.b; li.a = 1.0f;
            li.width = kSeriesLineWidth;
            m_seriesLines.push_back(li);
        }
    }

    m_markerVerts.clear();
    float half = kMarkerLineWidth * 0.5f;
    for (size_t row : markerRows) {
        float x = static_cast<float>(row - segment.begin);
        AddVerticalBand(m_markerVerts, x, x, -half, half, kMarkerColor);
    }

    UpdateSelectionSpan();

    if (m_initialized) {
        UploadBuffer(m_bandBuffer, m_bandVerts.data(), m_bandVerts.size() * sizeof(BandVertex), "bands");
        UploadBuffer(m_seriesBuffer, m_seriesLines.data(), m_seriesLines.size() * sizeof(LineInstance), "series");
        UploadBuffer(m_markerBuffer, m_markerVerts.data(), m_markerVerts.size() * sizeof(BandVertex), "markers");
        Refresh();
    } else {
        m_geometryDirty = true;
    }
}

void PlotCanvas::ClearData() {
    RowRange none;
    m_hasSpan = false;
    SetSegmentData(DataSet(), none, {}, {}, {});
}

void PlotCanvas::SetView(const ViewRange& view) {
    m_view = view;
    UpdateSelectionSpan();
    Refresh();
}

void PlotCanvas::ResetView() {
    SetView(m_homeView);
}

void PlotCanvas::SetSelectionEnabled(bool enabled) {
    m_selectionEnabled = enabled;
    if (!enabled) {
        m_selecting = false;
        ClearSelection();
    }
}

void PlotCanvas::ClearSelection() {
    m_hasSpan = false;
    UpdateSelectionSpan();
    Refresh();
}

void PlotCanvas::UpdateSelectionSpan() {
    m_spanVerts.clear();
    if (m_hasSpan || m_selecting) {
        float x0 = static_cast<float>(std::min(m_spanX0, m_spanX1) - m_xOrigin);
        float x1 = static_cast<float>(std::max(m_spanX0, m_spanX1) - m_xOrigin);
        AddVerticalBand(m_spanVerts, x0, x1, 0.0f, 0.0f, kSelectionColor);
    }
    if (m_initialized)
        UploadBuffer(m_spanBuffer, m_spanVerts.data(), m_spanVerts.size() * sizeof(BandVertex), "span");
}

void PlotCanvas::UpdateGridLines() {
    m_gridLines.clear();
    wxSize size = GetClientSize();
    int w = size.GetWidth();
    int h = size.GetHeight();
    if (w <= 0 || h <= 0) return;

    auto addDashed = [&](double ax, double ay, double bx, double by, double lengthPx) {
        int dashes = static_cast<int>(lengthPx / (kDashPx + kGapPx)) + 1;
        double step = (kDashPx + kGapPx) / lengthPx;
        double dash = kDashPx / lengthPx;
        for (int i = 0; i < dashes; i++) {
            double t0 = i * step;
            double t1 = std::min(1.0, t0 + dash);
            LineInstance li;
            li.x0 = static_cast<float>(ax + (bx - ax) * t0 - m_xOrigin);
            li.y0 = static_cast<float>(ay + (by - ay) * t0);
            li.x1 = static_cast<float>(ax + (bx - ax) * t1 - m_xOrigin);
            li.y1 = static_cast<float>(ay + (by - ay) * t1);
            li.r = kGridColor[0]; li.g = kGridColor[1]; li.b = kGridColor[2]; li.a = kGridColor[3];
            li.width = 1.0f;
            m_gridLines.push_back(li);
        }
    };

    for (double tx : ComputeNiceTicks(m_view.xMin, m_view.xMax, kXTickTarget))
        addDashed(tx, m_view.yMin, tx, m_view.yMax, h);
    for (double ty : ComputeNiceTicks(m_view.yMin, m_view.yMax, kYTickTarget))
        addDashed(m_view.xMin, ty, m_view.xMax, ty, w);

    UploadBuffer(m_gridBuffer, m_gridLines.data(), m_gridLines.size() * sizeof(LineInstance), "grid");
}

void PlotCanvas::InitSurface() {
    if (!m_ctx || !m_ctx->IsInitialized())
        return;

    auto device = m_ctx->GetDevice();

    if (!CreateNativeSurface())
        return;

    if (!m_surface) {
        fprintf(stderr, "Plot canvas: Failed to create surface\n");
        return;
    }

    // Get surface format
    auto adapter = m_ctx->GetAdapter();
    WGPUSurfaceCapabilities caps = {};
    wgpuSurfaceGetCapabilities(m_surface, adapter, &caps);
    if (caps.formatCount == 0) {
        fprintf(stderr, "Plot canvas: Surface reports no formats\n");
        wgpuSurfaceCapabilitiesFreeMembers(caps);
        return;
    }
    m_surfaceFormat = caps.formats[0];
    wgpuSurfaceCapabilitiesFreeMembers(caps);

    if (!m_ctx->PreparePipelines(m_surfaceFormat))
        return;

    WGPUBufferDescriptor ubDesc = {};
    ubDesc.label = {"uniforms", WGPU_STRLEN};
    ubDesc.size = sizeof(Uniforms);
    ubDesc.usage = WGPUBufferUsage_Uniform | WGPUBufferUsage_CopyDst;
    m_uniformBuffer = wgpuDeviceCreateBuffer(device, &ubDesc);
    m_bindGroup = m_ctx->CreateUniformBindGroup(m_uniformBuffer);

    wxSize size = GetClientSize();
    double scale = GetContentScaleFactor();
    ConfigureSurface(static_cast<int>(size.GetWidth() * scale),
                     static_cast<int>(size.GetHeight() * scale));

    m_initialized = true;

    if (m_geometryDirty) {
        UploadBuffer(m_bandBuffer, m_bandVerts.data(), m_bandVerts.size() * sizeof(BandVertex), "bands");
        UploadBuffer(m_seriesBuffer, m_seriesLines.data(), m_seriesLines.size() * sizeof(LineInstance), "series");
        UploadBuffer(m_markerBuffer, m_markerVerts.data(), m_markerVerts.size() * sizeof(BandVertex), "markers");
        UpdateSelectionSpan();
        m_geometryDirty = false;
    }
    Refresh();
}

// Returns false when the native window is not ready; m_surface stays null on error.
bool PlotCanvas::CreateNativeSurface() {
    auto instance = m_ctx->GetInstance();

#if defined(__WXMAC__)
    NSView* nsView = (NSView*)GetHandle();
    if (!nsView) {
        fprintf(stderr, "Plot canvas: Failed to get NSView\n");
        return false;
    }

    [nsView setWantsLayer:YES];

    CAMetalLayer* metalLayer = [CAMetalLayer layer];
    metalLayer.contentsScale = nsView.window.backingScaleFactor;
    metalLayer.frame = nsView.bounds;
    metalLayer.autoresizingMask = kCALayerWidthSizable | kCALayerHeightSizable;
    metalLayer.pixelFormat = MTLPixelFormatBGRA8Unorm;

    [nsView.layer addSublayer:metalLayer];
    m_metalLayer = (__bridge void*)metalLayer;

    WGPUSurfaceSourceMetalLayer metalDesc = {};
    metalDesc.chain.sType = WGPUSType_SurfaceSourceMetalLayer;
    metalDesc.layer = (__bridge void*)metalLayer;

    WGPUSurfaceDescriptor surfDesc = {};
    surfDesc.nextInChain = &metalDesc.chain;
    m_surface = wgpuInstanceCreateSurface(instance, &surfDesc);
#elif defined(__WXGTK__)
    GdkWindow* gdkWindow = GTKGetDrawingWindow();
    if (!gdkWindow) {
        // Not realized yet; try again once the event loop has run
        if (++m_initAttempts < kMaxInitAttempts)
            CallAfter([this]() { InitSurface(); });
        else
            fprintf(stderr, "Plot canvas: Window was never realized\n");
        return false;
    }
    if (!GDK_IS_X11_WINDOW(gdkWindow)) {
        fprintf(stderr, "Plot canvas: Only X11 surfaces are supported, run with GDK_BACKEND=x11\n");
        return false;
    }
    if (!gdk_window_ensure_native(gdkWindow)) {
        fprintf(stderr, "Plot canvas: Failed to get a native X11 window\n");
        return false;
    }

    WGPUSurfaceSourceXlibWindow xlibDesc = {};
    xlibDesc.chain.sType = WGPUSType_SurfaceSourceXlibWindow;
    xlibDesc.display = gdk_x11_display_get_xdisplay(gdk_window_get_display(gdkWindow));
    xlibDesc.window = gdk_x11_window_get_xid(gdkWindow);

    WGPUSurfaceDescriptor surfDesc = {};
    surfDesc.nextInChain = &xlibDesc.chain;
    m_surface = wgpuInstanceCreateSurface(instance, &surfDesc);
#elif defined(__WXMSW__)
    WGPUSurfaceSourceWindowsHWND hwndDesc = {};
    hwndDesc.chain.sType = WGPUSType_SurfaceSourceWindowsHWND;
    hwndDesc.hinstance = GetModuleHandle(nullptr);
    hwndDesc.hwnd = GetHWND();

    WGPUSurfaceDescriptor surfDesc = {};
    surfDesc.nextInChain = &hwndDesc.chain;
    m_surface = wgpuInstanceCreateSurface(instance, &surfDesc);
#else
    (void)instance;
    fprintf(stderr, "Platform not supported\n");
    return false;
#endif
    return true;
}

void PlotCanvas::UploadBuffer(WGPUBuffer& buffer, const void* data, size_t bytes, const char* label) {
    if (buffer) {
        wgpuBufferRelease(buffer);
        buffer = nullptr;
    }
    if (m_ctx)
        buffer = m_ctx->CreateVertexBuffer(data, bytes, label);
}

void PlotCanvas::UpdateUniforms() {
    makeOrtho(m_uniforms.projection,
              static_cast<float>(m_view.xMin - m_xOrigin), static_cast<float>(m_view.xMax - m_xOrigin),
              static_cast<float>(m_view.yMin), static_cast<float>(m_view.yMax));

    wxSize size = GetClientSize();
    double scale = GetContentScaleFactor();
    m_uniforms.viewportW = static_cast<float>(size.GetWidth() * scale);
    m_uniforms.viewportH = static_cast<float>(size.GetHeight() * scale);
    m_uniforms.pixelRatio = static_cast<float>(scale);

    wgpuQueueWriteBuffer(m_ctx->GetQueue(), m_uniformBuffer, 0, &m_uniforms, sizeof(Uniforms));
}

void PlotCanvas::ConfigureSurface(int width, int height) {
    if (!m_surface || !m_ctx || width <= 0 || height <= 0)
        return;

    m_surfaceConfig = {};
    m_surfaceConfig.device = m_ctx->GetDevice();
    m_surfaceConfig.usage = WGPUTextureUsage_RenderAttachment;
    m_surfaceConfig.format = m_surfaceFormat;
    m_surfaceConfig.presentMode = WGPUPresentMode_Fifo;
    m_surfaceConfig.alphaMode = WGPUCompositeAlphaMode_Auto;
    m_surfaceConfig.width = static_cast<uint32_t>(width);
    m_surfaceConfig.height = static_cast<uint32_t>(height);

    wgpuSurfaceConfigure(m_surface, &m_surfaceConfig);

#ifdef __WXMAC__
    CAMetalLayer* metalLayer = (__bridge CAMetalLayer*)m_metalLayer;
    metalLayer.drawableSize = CGSizeMake(width, height);
#endif
}

void PlotCanvas::Render() {
    if (!m_initialized || !m_ctx)
        return;
    WGPURenderPipeline linePipeline = m_ctx->GetLinePipeline();
    WGPURenderPipeline bandPipeline = m_ctx->GetBandPipeline();
    if (!linePipeline || !bandPipeline)
        return;
    if (m_view.xMax <= m_view.xMin || m_view.yMax <= m_view.yMin)
        return;

    UpdateUniforms();
    UpdateGridLines();

    if (onViewportChanged)
        onViewportChanged(m_view);

    WGPUSurfaceTexture surfTex;
    wgpuSurfaceGetCurrentTexture(m_surface, &surfTex);

    if (surfTex.status != WGPUSurfaceGetCurrentTextureStatus_SuccessOptimal &&
        surfTex.status != WGPUSurfaceGetCurrentTextureStatus_SuccessSuboptimal) {
        if (surfTex.texture) wgpuTextureRelease(surfTex.texture);
        wxSize size = GetClientSize();
        double scale = GetContentScaleFactor();
        ConfigureSurface(static_cast<int>(size.GetWidth() * scale),
                         static_cast<int>(size.GetHeight() * scale));
        return;
    }

    auto device = m_ctx->GetDevice();
    WGPUTextureView view = wgpuTextureCreateView(surfTex.texture, nullptr);

    WGPUCommandEncoderDescriptor encDesc = {};
    encDesc.label = {"cmd_enc", WGPU_STRLEN};
    WGPUCommandEncoder encoder = wgpuDeviceCreateCommandEncoder(device, &encDesc);

    WGPURenderPassColorAttachment colorAtt = {};
    colorAtt.view = view;
    colorAtt.loadOp = WGPULoadOp_Clear;
    colorAtt.storeOp = WGPUStoreOp_Store;
    colorAtt.depthSlice = WGPU_DEPTH_SLICE_UNDEFINED;
    colorAtt.clearValue = {1.0, 1.0, 1.0, 1.0};

    WGPURenderPassDescriptor rpDesc = {};
    rpDesc.label = {"render_pass", WGPU_STRLEN};
    rpDesc.colorAttachmentCount = 1;
    rpDesc.colorAttachments = &colorAtt;

    WGPURenderPassEncoder rp = wgpuCommandEncoderBeginRenderPass(encoder, &rpDesc);
    auto cornerBuf = m_ctx->GetCornerBuffer();

    auto drawBands = [&](WGPUBuffer buffer, size_t count) {
        if (!buffer || count == 0) return;
        wgpuRenderPassEncoderSetPipeline(rp, bandPipeline);
        wgpuRenderPassEncoderSetBindGroup(rp, 0, m_bindGroup, 0, nullptr);
        wgpuRenderPassEncoderSetVertexBuffer(rp, 0, buffer, 0, count * sizeof(BandVertex));
        wgpuRenderPassEncoderDraw(rp, static_cast<uint32_t>(count), 1, 0, 0);
    };
    auto drawLines = [&](WGPUBuffer buffer, size_t count) {
        if (!buffer || !cornerBuf || count == 0) return;
        wgpuRenderPassEncoderSetPipeline(rp, linePipeline);
        wgpuRenderPassEncoderSetBindGroup(rp, 0, m_bindGroup, 0, nullptr);
        wgpuRenderPassEncoderSetVertexBuffer(rp, 0, cornerBuf, 0, 6 * 2 * sizeof(float));
        wgpuRenderPassEncoderSetVertexBuffer(rp, 1, buffer, 0, count * sizeof(LineInstance));
        wgpuRenderPassEncoderDraw(rp, 6, static_cast<uint32_t>(count), 0, 0);
    };

    drawBands(m_bandBuffer, m_bandVerts.size());
    drawLines(m_gridBuffer, m_gridLines.size());
    drawLines(m_seriesBuffer, m_seriesLines.size());
    drawBands(m_markerBuffer, m_markerVerts.size());
    drawBands(m_spanBuffer, m_spanVerts.size());

    wgpuRenderPassEncoderEnd(rp);
    wgpuRenderPassEncoderRelease(rp);

    WGPUCommandBufferDescriptor cbDesc = {};
    cbDesc.label = {"cmd_buf", WGPU_STRLEN};
    WGPUCommandBuffer cmdBuf = wgpuCommandEncoderFinish(encoder, &cbDesc);

    wgpuQueueSubmit(m_ctx->GetQueue(), 1, &cmdBuf);
    wgpuSurfacePresent(m_surface);

    wgpuCommandBufferRelease(cmdBuf);
    wgpuCommandEncoderRelease(encoder);
    wgpuTextureViewRelease(view);
    wgpuTextureRelease(surfTex.texture);
}

void PlotCanvas::OnPaint(wxPaintEvent& event) {
    wxPaintDC dc(this);
    Render();
}

void PlotCanvas::OnSize(wxSizeEvent& event) {
    wxSize size = event.GetSize();
    if (m_initialized && size.GetWidth() > 0 && size.GetHeight() > 0) {
        double scale = GetContentScaleFactor();
        ConfigureSurface(static_cast<int>(size.GetWidth() * scale),
                         static_cast<int>(size.GetHeight() * scale));
#ifdef __WXMAC__
        NSView* nsView = (NSView*)GetHandle();
        CAMetalLayer* metalLayer = (__bridge CAMetalLayer*)m_metalLayer;
        metalLayer.frame = nsView.bounds;
#endif
        Refresh();
    }
    event.Skip();
}

void PlotCanvas::OnMouse(wxMouseEvent& event) {
    wxSize size = GetClientSize();

    if (event.LeftDClick()) {
        if (onToggleCompact) onToggleCompact();
        return;
    }

    if (event.LeftDown() || event.MiddleDown()) {
        SetFocus();
        m_panning = true;
        m_lastMouse = event.GetPosition();
        if (!HasCapture()) CaptureMouse();
    } else if (event.RightDown()) {
        SetFocus();
        if (m_selectionEnabled) {
            m_selecting = true;
            m_selectStart = event.GetPosition();
            m_selectEnd = m_selectStart;
            m_spanX0 = m_spanX1 = PixelToDataX(m_selectStart.x, m_view, size.GetWidth());
            if (!HasCapture()) CaptureMouse();
        }
    } else if (event.LeftUp() || event.MiddleUp() || event.RightUp()) {
        if (m_selecting && event.RightUp()) {
            m_selecting = false;
            if (std::abs(m_selectEnd.x - m_selectStart.x) > 2) {
                m_hasSpan = true;
                UpdateSelectionSpan();
                if (onRangeSelected)
                    onRangeSelected(m_selectStart.x, m_selectEnd.x);
            } else {
                m_hasSpan = false;
                UpdateSelectionSpan();
                if (onSelectionCleared) onSelectionCleared();
            }
        }
        if (!event.RightUp())
            m_panning = false;
        if (!m_panning && !m_selecting && HasCapture()) ReleaseMouse();
        Refresh();
    } else if (event.Dragging()) {
        wxPoint pos = event.GetPosition();
        if (m_panning) {
            PanView(m_view, pos.x - m_lastMouse.x, pos.y - m_lastMouse.y,
                    size.GetWidth(), size.GetHeight());
            m_lastMouse = pos;
            UpdateSelectionSpan();
            Refresh();
        } else if (m_selecting) {
            m_selectEnd = pos;
            m_spanX1 = PixelToDataX(pos.x, m_view, size.GetWidth());
            UpdateSelectionSpan();
            Refresh();
        }
    } else if (event.GetWheelRotation() != 0) {
        double factor = event.GetWheelRotation() > 0 ? kWheelZoomStep : 1.0 / kWheelZoomStep;
        wxPoint pos = event.GetPosition();
        if (event.ControlDown()) {
            double cy = PixelToDataY(pos.y, m_view, size.GetHeight());
            ZoomLimits(m_view.yMin, m_view.yMax, cy, factor);
        } else {
            double cx = PixelToDataX(pos.x, m_view, size.GetWidth());
            ZoomLimits(m_view.xMin, m_view.xMax, cx, factor);
        }
        UpdateSelectionSpan();
        Refresh();
    }
    event.Skip();
}

void PlotCanvas::OnKeyDown(wxKeyEvent& event) {
    int key = event.GetKeyCode();
    if (key >= 'a' && key <= 'z') key -= 32;

    switch (key) {
        case 'R':
            ResetView();
            break;
        default:
            event.Skip();
            break;
    }
}

void PlotCanvas::Cleanup() {
    if (m_spanBuffer) { wgpuBufferRelease(m_spanBuffer); m_spanBuffer = nullptr; }
    if (m_markerBuffer) { wgpuBufferRelease(m_markerBuffer); m_markerBuffer = nullptr; }
    if (m_seriesBuffer) { wgpuBufferRelease(m_seriesBuffer); m_seriesBuffer = nullptr; }
    if (m_gridBuffer) { wgpuBufferRelease(m_gridBuffer); m_gridBuffer = nullptr; }
    if (m_bandBuffer) { wgpuBufferRelease(m_bandBuffer); m_bandBuffer = nullptr; }
    if (m_bindGroup) { wgpuBindGroupRelease(m_bindGroup); m_bindGroup = nullptr; }
    if (m_uniformBuffer) { wgpuBufferRelease(m_uniformBuffer); m_uniformBuffer = nullptr; }
    if (m_surface) { wgpuSurfaceRelease(m_surface); m_surface = nullptr; }
    m_initialized = false;
}
