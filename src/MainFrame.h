// Tracemark (MIT License) - See LICENSE file
#pragma once

#include <wx/wx.h>
#include "DataManager.h"
#include "WebGPUContext.h"
#include "Segmenter.h"
#include "RangeSelection.h"
#include "CategoryIndex.h"
#include "ViewerConfig.h"
#include <vector>
#include <array>
#include <optional>

class PlotCanvas;
class ControlPanel;
class LegendPanel;
class DataGridTable;
class wxGrid;
class wxSplitterWindow;

class MainFrame : public wxFrame {
public:
    explicit MainFrame(const ViewerConfig& config);
    void LoadFileFromPath(const std::string& path);

private:
    void CreateMenuBar();
    void CreateTools();
    void CreateLayout();
    void LoadFile(const std::string& path);
    void RedrawPlot(bool keepView);
    void UpdateLegend();
    void UpdateTickLabels(const ViewRange& view);
    void UpdateTitle();
    void UpdateSaveActions();

    void GoToSegment(size_t index);
    void HandleRangeSelected(int px0, int px1);
    void ClearPendingSelection();
    void ApplyToSelection();
    void HandleBackgroundColumnChanged(std::optional<size_t> column);
    void HandleMarkerColumnChanged(std::optional<size_t> column);
    std::optional<std::vector<std::string>> ListableValues(size_t column) const;

    void ToggleCompact();
    void ApplyCompactMode();

    bool SaveTo(const std::string& path);
    bool SaveCurrent();
    bool ConfirmDiscardChanges(const wxString& action);
    bool SaveAs();

    void OnOpen(wxCommandEvent& event);
    void OnQuit(wxCommandEvent& event);
    void OnAbout(wxCommandEvent& event);
    void OnClose(wxCloseEvent& event);

    WebGPUContext m_gpuContext;
    ViewerConfig m_config;
    DataManager m_dataManager;
    Segmenter m_segmenter;

    static constexpr int MAX_NICE_TICKS = 16;
    static constexpr int Y_TICK_WIDTH = 52;

    ControlPanel* m_controlPanel = nullptr;
    wxSplitterWindow* m_splitter = nullptr;
    wxGrid* m_grid = nullptr;
    DataGridTable* m_gridTable = nullptr;   // owned by m_grid
    wxPanel* m_plotPanel = nullptr;
    PlotCanvas* m_canvas = nullptr;
    LegendPanel* m_legend = nullptr;
    wxPanel* m_xTickPanel = nullptr;
    wxPanel* m_yTickPanel = nullptr;
    std::array<wxStaticText*, MAX_NICE_TICKS> m_xTicks = {};
    std::array<wxStaticText*, MAX_NICE_TICKS> m_yTicks = {};
    wxToolBar* m_toolBar = nullptr;
    int m_sashPosition = 420;

    // State of the last redraw
    std::vector<size_t> m_plottedColumns;
    CategoryColorMap m_bgColors;

    std::optional<RowInterval> m_pendingSelection;
    bool m_compact = false;
    bool m_showSeriesLegend = true;
    bool m_showBgLegend = true;

    enum {
        ID_PlotOnly = wxID_HIGHEST + 1,
        ID_SeriesLegend,
        ID_BackgroundLegend,
        ID_ResetView,
    };
};
