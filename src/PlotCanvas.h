// Tracemark (MIT License) - See LICENSE file
#pragma once

#include <wx/wx.h>
#include <webgpu.h>
#include <wgpu.h>
#include <vector>
#include <functional>
#include "WebGPUContext.h"
#include "AxisScale.h"
#include "CategoryIndex.h"
#include "Segmenter.h"

struct DataSet;

// Time-series plot of one segment: category bands behind the series lines,
// marker lines and the pending selection span on top.
class PlotCanvas : public wxWindow {
public:
    PlotCanvas(wxWindow* parent, WebGPUContext* ctx);
    ~PlotCanvas() override;

    // Rebuilds all geometry for `segment`. Columns are drawn in order with the
    // series color cycle; runs and marker rows come from CategoryIndex.
    void SetSegmentData(const DataSet& data, const RowRange& segment,
                        const std::vector<size_t>& columns,
                        const std::vector<CategoryRun>& runs,
                        const std::vector<size_t>& markerRows);
    void ClearData();

    void SetView(const ViewRange& view);
    const ViewRange& GetView() const { return m_view; }
    // View restored by ResetView (normally the autoscaled one)
    void SetHomeView(const ViewRange& view) { m_homeView = view; }
    void ResetView();

    // Right-drag spans are only tracked while enabled
    void SetSelectionEnabled(bool enabled);
    void ClearSelection();
    bool HasSelection() const { return m_hasSpan; }

    // Right-drag finished: span in pixels relative to the canvas
    std::function<void(int px0, int px1)> onRangeSelected;
    std::function<void()> onSelectionCleared;
    std::function<void()> onToggleCompact;
    // Called on each render with the visible data window
    std::function<void(const ViewRange& view)> onViewportChanged;

private:
    void InitSurface();
    bool CreateNativeSurface();
    void ConfigureSurface(int width, int height);
    void UploadBuffer(WGPUBuffer& buffer, const void* data, size_t bytes, const char* label);
    void UpdateGridLines();
    void UpdateSelectionSpan();
    void UpdateUniforms();
    void Render();
    void Cleanup();

    void AddVerticalBand(std::vector<BandVertex>& out, float x0, float x1,
                         float offset0, float offset1, const float* rgba);

    void OnPaint(wxPaintEvent& event);
    void OnSize(wxSizeEvent& event);
    void OnMouse(wxMouseEvent& event);
    void OnKeyDown(wxKeyEvent& event);

    WebGPUContext* m_ctx = nullptr;

    WGPUSurface m_surface = nullptr;
    WGPUSurfaceConfiguration m_surfaceConfig = {};
    WGPUTextureFormat m_surfaceFormat = WGPUTextureFormat_Undefined;
    WGPUBuffer m_uniformBuffer = nullptr;
    WGPUBindGroup m_bindGroup = nullptr;

    // Geometry, x relative to m_xOrigin
    WGPUBuffer m_bandBuffer = nullptr;
    WGPUBuffer m_gridBuffer = nullptr;
    WGPUBuffer m_seriesBuffer = nullptr;
    WGPUBuffer m_markerBuffer = nullptr;
    WGPUBuffer m_spanBuffer = nullptr;
    std::vector<BandVertex> m_bandVerts;
    std::vector<LineInstance> m_gridLines;
    std::vector<LineInstance> m_seriesLines;
    std::vector<BandVertex> m_markerVerts;
    std::vector<BandVertex> m_spanVerts;
    bool m_geometryDirty = false;

    bool m_initialized = false;
    int m_initAttempts = 0;
    Uniforms m_uniforms = {};

    double m_xOrigin = 0.0;
    ViewRange m_view;
    ViewRange m_homeView;

    // Pending selection in data x
    bool m_selectionEnabled = false;
    bool m_hasSpan = false;
    double m_spanX0 = 0.0, m_spanX1 = 0.0;

    // Mouse interaction
    bool m_panning = false;
    bool m_selecting = false;
    wxPoint m_lastMouse;
    wxPoint m_selectStart;
    wxPoint m_selectEnd;

    // Platform-specific
    void* m_metalLayer = nullptr;
};
