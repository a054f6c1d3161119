// Tracemark (MIT License) - See LICENSE file
#include "MainFrame.h"
#include "PlotCanvas.h"
#include "ControlPanel.h"
#include "LegendPanel.h"
#include "DataGridTable.h"
#include "SeriesStyle.h"
#include <wx/grid.h>
#include <wx/splitter.h>
#include <wx/artprov.h>
#include <wx/filename.h>
#include <wx/progdlg.h>
#include <algorithm>
#include <chrono>

MainFrame::MainFrame(const ViewerConfig& config)
    : wxFrame(nullptr, wxID_ANY, "Tracemark"),
      m_config(config)
{
    wxRect clientArea = wxGetClientDisplayRect();
    SetSize(std::min(clientArea.width, 1400), std::min(clientArea.height, 820));
    Centre();

    m_dataManager.setCategoryLimit(m_config.maxCategories);

    // Initialize shared GPU context before creating the canvas
    if (!m_gpuContext.Initialize()) {
        wxMessageBox("Failed to initialize WebGPU:\n" + wxString(m_gpuContext.GetErrorMessage()),
                     "Fatal Error", wxOK | wxICON_ERROR);
    }

    CreateMenuBar();
    CreateTools();
    CreateLayout();
    CreateStatusBar(2);
    SetStatusText("Open a CSV, select columns, then Plot.");
    SetStatusText("Double-click the plot or press Esc for plot-only mode", 1);
    UpdateSaveActions();

    Bind(wxEVT_CLOSE_WINDOW, &MainFrame::OnClose, this);
}

void MainFrame::CreateMenuBar() {
    auto* menuBar = new wxMenuBar();

    auto* fileMenu = new wxMenu();
    fileMenu->Append(wxID_OPEN, "&Open...\tCtrl+O", "Open a CSV or Parquet file");
    fileMenu->AppendSeparator();
    fileMenu->Append(wxID_SAVE, "&Save\tCtrl+S", "Save the table to its file");
    fileMenu->Append(wxID_SAVEAS, "Save &As...\tCtrl+Shift+S", "Save the table to a new file");
    fileMenu->AppendSeparator();
    fileMenu->Append(wxID_EXIT, "&Quit\tCtrl+Q", "Quit Tracemark");
    menuBar->Append(fileMenu, "&File");

    auto* settingsMenu = new wxMenu();
    settingsMenu->AppendCheckItem(ID_SeriesLegend, "Show &series legend", "Show the series legend");
    settingsMenu->AppendCheckItem(ID_BackgroundLegend, "Show &background legend",
                                  "Show the background category legend");
    settingsMenu->Check(ID_SeriesLegend, true);
    settingsMenu->Check(ID_BackgroundLegend, true);
    menuBar->Append(settingsMenu, "&Settings");

    auto* viewMenu = new wxMenu();
    viewMenu->AppendCheckItem(ID_PlotOnly, "&Plot only\tEsc", "Hide everything but the plot");
    viewMenu->Append(ID_ResetView, "&Reset View", "Restore the autoscaled view");
    menuBar->Append(viewMenu, "&View");

    auto* helpMenu = new wxMenu();
    helpMenu->Append(wxID_ABOUT, "&About...", "About Tracemark");
    menuBar->Append(helpMenu, "&Help");

    SetMenuBar(menuBar);

    Bind(wxEVT_MENU, &MainFrame::OnOpen, this, wxID_OPEN);
    Bind(wxEVT_MENU, [this](wxCommandEvent&) { SaveCurrent(); }, wxID_SAVE);
    Bind(wxEVT_MENU, [this](wxCommandEvent&) { SaveAs(); }, wxID_SAVEAS);
    Bind(wxEVT_MENU, &MainFrame::OnQuit, this, wxID_EXIT);
    Bind(wxEVT_MENU, &MainFrame::OnAbout, this, wxID_ABOUT);
    Bind(wxEVT_MENU, [this](wxCommandEvent& e) {
        m_showSeriesLegend = e.IsChecked();
        UpdateLegend();
    }, ID_SeriesLegend);
    Bind(wxEVT_MENU, [this](wxCommandEvent& e) {
        m_showBgLegend = e.IsChecked();
        UpdateLegend();
    }, ID_BackgroundLegend);
    Bind(wxEVT_MENU, [this](wxCommandEvent&) { ToggleCompact(); }, ID_PlotOnly);
    Bind(wxEVT_MENU, [this](wxCommandEvent&) { m_canvas->ResetView(); }, ID_ResetView);
}

void MainFrame::CreateTools() {
    m_toolBar = CreateToolBar(wxTB_HORIZONTAL | wxTB_FLAT);
    wxSize iconSize(16, 16);
    m_toolBar->AddTool(wxID_OPEN, "Open",
        wxArtProvider::GetBitmap(wxART_FILE_OPEN, wxART_TOOLBAR, iconSize), "Open a file");
    m_toolBar->AddTool(wxID_SAVE, "Save",
        wxArtProvider::GetBitmap(wxART_FILE_SAVE, wxART_TOOLBAR, iconSize), "Save");
    m_toolBar->AddTool(wxID_SAVEAS, "Save As",
        wxArtProvider::GetBitmap(wxART_FILE_SAVE_AS, wxART_TOOLBAR, iconSize), "Save as");
    m_toolBar->AddSeparator();
    m_toolBar->AddCheckTool(ID_PlotOnly, "Plot only",
        wxArtProvider::GetBitmap(wxART_FULL_SCREEN, wxART_TOOLBAR, iconSize), wxNullBitmap,
        "Plot only (Esc)");
    m_toolBar->Realize();
    // Tool clicks arrive as wxEVT_TOOL (== wxEVT_MENU) and reuse the menu handlers
}

void MainFrame::CreateLayout() {
    auto* mainSizer = new wxBoxSizer(wxHORIZONTAL);

    m_controlPanel = new ControlPanel(this);
    mainSizer->Add(m_controlPanel, 0, wxEXPAND);

    m_splitter = new wxSplitterWindow(this, wxID_ANY, wxDefaultPosition, wxDefaultSize,
                                      wxSP_LIVE_UPDATE | wxSP_3DSASH);
    m_splitter->SetMinimumPaneSize(120);
    mainSizer->Add(m_splitter, 1, wxEXPAND);

    // Table: virtual, read-only view of the dataset
    m_grid = new wxGrid(m_splitter, wxID_ANY);
    m_gridTable = new DataGridTable(m_dataManager);
    m_grid->SetTable(m_gridTable, true);
    m_grid->EnableEditing(false);
    m_grid->SetRowLabelSize(64);
    m_grid->SetDefaultColSize(90);

    // Plot: y ticks | canvas, then x ticks, axis label and legend underneath
    wxColour bgColor(*wxWHITE);
    wxFont tickFont(7, wxFONTFAMILY_SWISS, wxFONTSTYLE_NORMAL, wxFONTWEIGHT_NORMAL);
    wxColour tickTextColor(80, 80, 90);

    m_plotPanel = new wxPanel(m_splitter);
    m_plotPanel->SetBackgroundColour(bgColor);
    auto* plotSizer = new wxBoxSizer(wxVERTICAL);

    auto* canvasRow = new wxBoxSizer(wxHORIZONTAL);
    m_yTickPanel = new wxPanel(m_plotPanel, wxID_ANY, wxDefaultPosition, wxSize(Y_TICK_WIDTH, -1));
    m_yTickPanel->SetMinSize(wxSize(Y_TICK_WIDTH, -1));
    m_yTickPanel->SetBackgroundColour(bgColor);
    for (int t = 0; t < MAX_NICE_TICKS; t++) {
        auto* tickLabel = new wxStaticText(m_yTickPanel, wxID_ANY, "",
            wxDefaultPosition, wxDefaultSize, wxST_NO_AUTORESIZE);
        tickLabel->SetFont(tickFont);
        tickLabel->SetForegroundColour(tickTextColor);
        tickLabel->SetBackgroundColour(bgColor);
        tickLabel->Hide();
        m_yTicks[t] = tickLabel;
    }
    canvasRow->Add(m_yTickPanel, 0, wxEXPAND);

    m_canvas = new PlotCanvas(m_plotPanel, &m_gpuContext);
    canvasRow->Add(m_canvas, 1, wxEXPAND | wxTOP | wxRIGHT, 6);
    plotSizer->Add(canvasRow, 1, wxEXPAND);

    auto* tickRow = new wxBoxSizer(wxHORIZONTAL);
    tickRow->AddSpacer(Y_TICK_WIDTH);
    m_xTickPanel = new wxPanel(m_plotPanel, wxID_ANY, wxDefaultPosition, wxSize(-1, 14));
    m_xTickPanel->SetMinSize(wxSize(-1, 14));
    m_xTickPanel->SetBackgroundColour(bgColor);
    for (int t = 0; t < MAX_NICE_TICKS; t++) {
        auto* tickLabel = new wxStaticText(m_xTickPanel, wxID_ANY, "",
            wxDefaultPosition, wxDefaultSize, wxST_NO_AUTORESIZE);
        tickLabel->SetFont(tickFont);
        tickLabel->SetForegroundColour(tickTextColor);
        tickLabel->SetBackgroundColour(bgColor);
        tickLabel->Hide();
        m_xTicks[t] = tickLabel;
    }
    tickRow->Add(m_xTickPanel, 1, wxEXPAND | wxRIGHT, 6);
    plotSizer->Add(tickRow, 0, wxEXPAND);

    auto* xLabel = new wxStaticText(m_plotPanel, wxID_ANY, "index",
        wxDefaultPosition, wxSize(-1, 14), wxALIGN_CENTRE_HORIZONTAL | wxST_NO_AUTORESIZE);
    xLabel->SetFont(wxFont(8, wxFONTFAMILY_SWISS, wxFONTSTYLE_NORMAL, wxFONTWEIGHT_NORMAL));
    xLabel->SetForegroundColour(tickTextColor);
    plotSizer->Add(xLabel, 0, wxEXPAND | wxLEFT, Y_TICK_WIDTH);

    m_legend = new LegendPanel(m_plotPanel);
    m_legend->Hide();
    plotSizer->Add(m_legend, 0, wxEXPAND | wxLEFT | wxRIGHT | wxBOTTOM, 4);

    m_plotPanel->SetSizer(plotSizer);

    m_splitter->SplitVertically(m_grid, m_plotPanel, m_sashPosition);
    m_splitter->SetSashGravity(0.0);

    SetSizer(mainSizer);

    // Control panel callbacks
    m_controlPanel->onPlot = [this]() {
        RedrawPlot(false);
    };

    m_controlPanel->onBackgroundColumnChanged = [this](std::optional<size_t> column) {
        HandleBackgroundColumnChanged(column);
    };

    m_controlPanel->onMarkerColumnChanged = [this](std::optional<size_t> column) {
        HandleMarkerColumnChanged(column);
    };

    m_controlPanel->onApplyToSelection = [this]() {
        ApplyToSelection();
    };

    m_controlPanel->onPrevSegment = [this]() {
        if (m_segmenter.prev())
            GoToSegment(m_segmenter.currentIndex());
    };

    m_controlPanel->onNextSegment = [this]() {
        if (m_segmenter.next())
            GoToSegment(m_segmenter.currentIndex());
    };

    m_controlPanel->onGoToSegment = [this](size_t index) {
        if (m_segmenter.goTo(index))
            GoToSegment(m_segmenter.currentIndex());
    };

    // Canvas callbacks
    m_canvas->onRangeSelected = [this](int px0, int px1) {
        HandleRangeSelected(px0, px1);
    };

    m_canvas->onSelectionCleared = [this]() {
        ClearPendingSelection();
    };

    m_canvas->onToggleCompact = [this]() {
        ToggleCompact();
    };

    m_canvas->onViewportChanged = [this](const ViewRange& view) {
        UpdateTickLabels(view);
    };
}

void MainFrame::UpdateTickLabels(const ViewRange& view) {
    wxSize canvasSize = m_canvas->GetClientSize();
    int canvasW = canvasSize.GetWidth();
    int canvasH = canvasSize.GetHeight();
    if (canvasW < 10 || canvasH < 10) return;

    bool hasData = m_dataManager.hasData() && !m_plottedColumns.empty();
    auto xNiceTicks = hasData ? ComputeNiceTicks(view.xMin, view.xMax, kXTickTarget) : std::vector<double>{};
    auto yNiceTicks = hasData ? ComputeNiceTicks(view.yMin, view.yMax, kYTickTarget) : std::vector<double>{};

    // Canvas offsets inside its row (sizer border)
    wxPoint canvasPos = m_canvas->GetPosition();
    int xOffset = canvasPos.x - m_xTickPanel->GetPosition().x;
    int yOffset = canvasPos.y - m_yTickPanel->GetPosition().y;

    for (int t = 0; t < MAX_NICE_TICKS; t++) {
        auto* label = m_xTicks[t];
        if (t < (int)xNiceTicks.size()) {
            int px = static_cast<int>(DataToPixelX(xNiceTicks[t], view, canvasW));
            if (px >= 0 && px <= canvasW) {
                // Row indices print in full
                label->SetLabel(wxString::Format("%.10g", xNiceTicks[t]));
                label->SetSize(label->GetBestSize());
                wxSize tsz = label->GetSize();
                label->SetPosition(wxPoint(xOffset + px - tsz.GetWidth() / 2, 0));
                label->Show();
                continue;
            }
        }
        label->Hide();
    }

    for (int t = 0; t < MAX_NICE_TICKS; t++) {
        auto* label = m_yTicks[t];
        if (t < (int)yNiceTicks.size()) {
            int py = static_cast<int>(DataToPixelY(yNiceTicks[t], view, canvasH));
            if (py >= 0 && py <= canvasH) {
                label->SetLabel(wxString::Format("%.4g", yNiceTicks[t]));
                label->SetSize(label->GetBestSize());
                wxSize tsz = label->GetSize();
                label->SetPosition(wxPoint(Y_TICK_WIDTH - tsz.GetWidth() - 3,
                                           yOffset + py - tsz.GetHeight() / 2));
                label->Show();
                continue;
            }
        }
        label->Hide();
    }
}

std::optional<std::vector<std::string>> MainFrame::ListableValues(size_t column) const {
    const auto& ds = m_dataManager.dataset();
    if (column >= ds.numCols || ds.columnMeta[column].tooManyValues)
        return std::nullopt;
    return ds.columnMeta[column].values;
}

void MainFrame::RedrawPlot(bool keepView) {
    using Clock = std::chrono::steady_clock;
    auto t0 = Clock::now();
    auto elapsed = [&](Clock::time_point since) {
        return std::chrono::duration<double>(Clock::now() - since).count();
    };

    const auto& ds = m_dataManager.dataset();
    if (!m_dataManager.hasData() || ds.numRows == 0 || m_segmenter.count() == 0) {
        m_plottedColumns.clear();
        m_bgColors.clear();
        m_canvas->ClearData();
        UpdateLegend();
        return;
    }

    RowRange segment = m_segmenter.current();

    std::vector<size_t> columns = m_controlPanel->GetSeriesColumns();
    if (columns.empty())
        columns.push_back(0);

    // Background bands: only for columns whose values can be listed
    std::vector<CategoryRun> runs;
    m_bgColors.clear();
    if (auto bgCol = m_controlPanel->GetBackgroundColumn()) {
        if (auto values = ListableValues(*bgCol)) {
            auto noBackground = m_controlPanel->GetNoBackgroundValue();
            m_bgColors = BuildColorMap(SortedValues(*values), noBackground);
            runs = BuildCategoryRuns(ds.cells[*bgCol], segment, noBackground, m_bgColors);
        }
    }

    std::vector<size_t> markerRows;
    if (auto markerCol = m_controlPanel->GetMarkerColumn()) {
        if (auto markerValue = m_controlPanel->GetMarkerValue())
            markerRows = FindMarkerRows(ds.cells[*markerCol], segment, *markerValue);
    }

    ViewRange keep = m_canvas->GetView();
    ViewRange home = AutoscaleView(ds, columns, segment);

    m_plottedColumns = columns;
    m_canvas->SetSegmentData(ds, segment, columns, runs, markerRows);
    m_canvas->SetHomeView(home);
    m_canvas->SetView(keepView ? keep : home);
    UpdateLegend();

    fprintf(stderr, "Plot: segment %zu/%zu rows %zu..%zu, %zu series, %zu bands, %zu markers\n",
            m_segmenter.currentIndex() + 1, m_segmenter.count(), segment.begin, segment.end,
            columns.size(), runs.size(), markerRows.size());
    fprintf(stderr, "TIMING: RedrawPlot          %.3f s\n", elapsed(t0));
}

void MainFrame::UpdateLegend() {
    const auto& ds = m_dataManager.dataset();
    std::vector<LegendPanel::Entry> series, background;

    if (m_showSeriesLegend) {
        for (size_t k = 0; k < m_plottedColumns.size(); k++) {
            size_t col = m_plottedColumns[k];
            if (col >= ds.numCols) continue;
            Rgb c = SeriesColor(k);
            series.push_back({wxString::FromUTF8(ds.columnLabels[col]),
                              wxColour(static_cast<unsigned char>(c.r * 255.0f),
                                       static_cast<unsigned char>(c.g * 255.0f),
                                       static_cast<unsigned char>(c.b * 255.0f)),
                              false});
        }
    }

    if (m_showBgLegend) {
        // Patches are drawn as the band color over white
        auto blend = [](float v) {
            return static_cast<unsigned char>((v * kLegendPatchAlpha + (1.0f - kLegendPatchAlpha)) * 255.0f);
        };
        for (const auto& cc : m_bgColors) {
            background.push_back({wxString::FromUTF8(cc.value),
                                  wxColour(blend(cc.color.r), blend(cc.color.g), blend(cc.color.b)),
                                  true});
        }
    }

    m_legend->SetEntries(series, background);
    m_legend->Show(!m_legend->IsEmpty());
    m_plotPanel->Layout();
}

void MainFrame::GoToSegment(size_t index) {
    m_controlPanel->SetSegmentInfo(index, m_segmenter.count());
    ClearPendingSelection();
    RedrawPlot(false);
    RowRange segment = m_segmenter.current();
    SetStatusText(wxString::Format("Segment %zu / %zu: rows %zu to %zu",
                                   index + 1, m_segmenter.count(),
                                   segment.begin, segment.end > 0 ? segment.end - 1 : 0));
}

void MainFrame::HandleRangeSelected(int px0, int px1) {
    auto rows = MapPixelSpanToRows(px0, px1, m_canvas->GetView(),
                                   m_canvas->GetClientSize().GetWidth(), m_segmenter.current());
    if (!rows) {
        ClearPendingSelection();
        return;
    }
    m_pendingSelection = rows;
    wxString text = wxString::Format("Selected: rows %zu to %zu (%zu rows)",
                                     rows->first, rows->last, rows->count());
    m_controlPanel->SetSelectionText(text);
    m_controlPanel->SetSelectionPending(true);
    SetStatusText(text);
}

void MainFrame::ClearPendingSelection() {
    m_pendingSelection.reset();
    m_controlPanel->SetSelectionText("No selection");
    m_controlPanel->SetSelectionPending(false);
    if (m_canvas->HasSelection())
        m_canvas->ClearSelection();
}

void MainFrame::ApplyToSelection() {
    if (!m_pendingSelection) return;

    auto column = m_controlPanel->GetBackgroundColumn();
    if (!column) {
        wxMessageBox("Please select a category column first.", "No Category Column",
                     wxOK | wxICON_WARNING, this);
        return;
    }

    std::string value = m_controlPanel->GetAssignValue();
    if (value.empty()) {
        wxMessageBox("Please enter or select a value to assign.", "No Value",
                     wxOK | wxICON_WARNING, this);
        return;
    }

    RowInterval rows = *m_pendingSelection;
    if (!ApplySelection(m_dataManager, *column, rows, value)) {
        wxMessageBox("Failed to update rows:\n" + m_dataManager.errorMessage(),
                     "Edit Error", wxOK | wxICON_ERROR, this);
        return;
    }

    auto values = ListableValues(*column);
    m_controlPanel->SetAssignValues(values);
    m_grid->ForceRefresh();
    RedrawPlot(true);
    ClearPendingSelection();
    UpdateTitle();

    SetStatusText(wxString::Format("Updated rows %zu to %zu with value '%s'",
                                   rows.first, rows.last, wxString::FromUTF8(value)));
}

void MainFrame::HandleBackgroundColumnChanged(std::optional<size_t> column) {
    if (!column) {
        m_controlPanel->SetBackgroundValues(std::vector<std::string>{});
        m_controlPanel->SetAssignValues(std::vector<std::string>{});
        ClearPendingSelection();
        m_canvas->SetSelectionEnabled(false);
        return;
    }

    auto values = ListableValues(*column);
    m_controlPanel->SetBackgroundValues(values);
    m_controlPanel->SetAssignValues(values);
    m_canvas->SetSelectionEnabled(true);
}

void MainFrame::HandleMarkerColumnChanged(std::optional<size_t> column) {
    if (!column) {
        m_controlPanel->SetMarkerValues(std::vector<std::string>{});
        return;
    }
    m_controlPanel->SetMarkerValues(ListableValues(*column));
}

void MainFrame::ToggleCompact() {
    m_compact = !m_compact;
    ApplyCompactMode();
}

void MainFrame::ApplyCompactMode() {
    bool show = !m_compact;

    m_controlPanel->Show(show);
    if (show) {
        if (!m_splitter->IsSplit()) {
            m_grid->Show();
            m_splitter->SplitVertically(m_grid, m_plotPanel, m_sashPosition);
        }
    } else if (m_splitter->IsSplit()) {
        m_sashPosition = m_splitter->GetSashPosition();
        m_splitter->Unsplit(m_grid);
    }
    if (m_toolBar) m_toolBar->Show(show);
    if (GetStatusBar()) GetStatusBar()->Show(show);

    GetMenuBar()->Check(ID_PlotOnly, m_compact);
    if (m_toolBar) m_toolBar->ToggleTool(ID_PlotOnly, m_compact);

    Layout();
    SendSizeEvent();
    m_canvas->SetFocus();
}

void MainFrame::UpdateTitle() {
    const std::string& path = m_dataManager.filePath();
    if (path.empty()) {
        SetTitle("Tracemark");
        return;
    }
    wxString name = wxFileName(wxString::FromUTF8(path)).GetFullName();
    if (m_dataManager.hasUnsavedChanges())
        name += " *";
    SetTitle(name + " - Tracemark");
}

void MainFrame::UpdateSaveActions() {
    bool canSave = m_dataManager.hasData();
    GetMenuBar()->Enable(wxID_SAVE, canSave);
    GetMenuBar()->Enable(wxID_SAVEAS, canSave);
    if (m_toolBar) {
        m_toolBar->EnableTool(wxID_SAVE, canSave);
        m_toolBar->EnableTool(wxID_SAVEAS, canSave);
    }
}

void MainFrame::LoadFile(const std::string& path) {
    if (!ConfirmDiscardChanges("Open another file"))
        return;

    using Clock = std::chrono::steady_clock;
    auto t0 = Clock::now();
    auto elapsed = [&](Clock::time_point since) {
        return std::chrono::duration<double>(Clock::now() - since).count();
    };

    wxProgressDialog progressDlg("Loading Data", "Loading " + wxString(path).AfterLast('/'),
                                  100, this,
                                  wxPD_APP_MODAL | wxPD_AUTO_HIDE | wxPD_SMOOTH | wxPD_CAN_ABORT);

    bool cancelled = false;
    auto progressCb = [&](size_t current, size_t total) -> bool {
        int pct = (total > 0) ? static_cast<int>((current * 100) / total) : 0;
        pct = std::min(pct, 99);
        wxString msg;
        if (total > 10000) {
            msg = wxString::Format("Loading... %zu KB / %zu KB", current / 1024, total / 1024);
        } else {
            msg = wxString::Format("Loading... %zu / %zu", current, total);
        }
        cancelled = !progressDlg.Update(pct, msg);
        wxYield();
        return !cancelled;
    };

    auto tLoad = Clock::now();
    if (!m_dataManager.loadFile(path, progressCb, m_config.maxRows)) {
        if (!cancelled) {
            wxMessageBox("Failed to load file:\n" + m_dataManager.errorMessage(),
                         "Load Error", wxOK | wxICON_ERROR, this);
        }
        return;
    }
    fprintf(stderr, "TIMING: loadFile            %.3f s\n", elapsed(tLoad));

    auto tProcess = Clock::now();
    const auto& ds = m_dataManager.dataset();
    fprintf(stderr, "Processing %zu rows x %zu cols\n", ds.numRows, ds.numCols);

    m_gridTable->NotifyShapeChanged(m_grid->GetNumberRows(), m_grid->GetNumberCols());
    for (int c = 0; c < m_grid->GetNumberCols(); c++)
        m_grid->AutoSizeColLabelSize(c);

    m_pendingSelection.reset();
    m_canvas->SetSelectionEnabled(false);
    m_controlPanel->SetColumns(ds.columnLabels);
    m_controlPanel->SetSelectionText("No selection");
    m_controlPanel->SetSelectionPending(false);

    m_segmenter.reset(ds.numRows, ChunkSizeFor(ds.numRows, m_config));
    m_controlPanel->SetSegmentInfo(0, m_segmenter.count());
    fprintf(stderr, "Segments: %zu (chunk size %zu)\n", m_segmenter.count(), m_segmenter.chunkSize());
    fprintf(stderr, "TIMING: processing          %.3f s\n", elapsed(tProcess));

    UpdateTitle();
    UpdateSaveActions();
    SetStatusText(wxString::Format("Loaded: %s (%zu rows, segments: %zu)",
                                   wxString::FromUTF8(path), ds.numRows, m_segmenter.count()));

    auto tPlot = Clock::now();
    RedrawPlot(false);
    fprintf(stderr, "TIMING: first plot          %.3f s\n", elapsed(tPlot));
    fprintf(stderr, "TIMING: total load-to-ready %.3f s\n", elapsed(t0));
    fflush(stderr);
}

void MainFrame::OnOpen(wxCommandEvent& event) {
    // Hide the canvas so the file dialog isn't covered by the GPU surface
    m_canvas->Hide();

    wxFileDialog dialog(this, "Open Data File", "", "",
        "All supported files|*.csv;*.txt;*.parquet;*.pq|"
        "CSV files (*.csv)|*.csv|"
        "Parquet files (*.parquet)|*.parquet;*.pq|"
        "All files (*.*)|*.*",
        wxFD_OPEN | wxFD_FILE_MUST_EXIST);

    int result = dialog.ShowModal();
    m_canvas->Show();
    m_plotPanel->Layout();

    if (result == wxID_OK)
        LoadFile(dialog.GetPath().ToStdString());
}

bool MainFrame::SaveTo(const std::string& path) {
    if (!m_dataManager.save(path)) {
        wxMessageBox("Failed to save file:\n" + m_dataManager.errorMessage(),
                     "Save Error", wxOK | wxICON_ERROR, this);
        return false;
    }
    SetStatusText("Saved: " + wxString::FromUTF8(path));
    UpdateTitle();
    return true;
}

bool MainFrame::SaveCurrent() {
    if (!m_dataManager.hasData()) return false;
    if (m_dataManager.filePath().empty())
        return SaveAs();
    return SaveTo(m_dataManager.filePath());
}

bool MainFrame::SaveAs() {
    if (!m_dataManager.hasData()) return false;

    wxFileName current(wxString::FromUTF8(m_dataManager.filePath()));
    m_canvas->Hide();
    wxFileDialog dialog(this, "Save Data As", current.GetPath(), current.GetFullName(),
        "CSV files (*.csv)|*.csv|Parquet files (*.parquet)|*.parquet|All files (*.*)|*.*",
        wxFD_SAVE | wxFD_OVERWRITE_PROMPT);
    int result = dialog.ShowModal();
    m_canvas->Show();
    m_plotPanel->Layout();

    if (result != wxID_OK)
        return false;
    return SaveTo(dialog.GetPath().ToStdString());
}

void MainFrame::LoadFileFromPath(const std::string& path) {
    CallAfter([this, path]() { LoadFile(path); });
}

void MainFrame::OnQuit(wxCommandEvent& event) { Close(false); }

// Asks Save / Discard / Cancel when there are unsaved edits.
// Returns false when the caller should stop.
bool MainFrame::ConfirmDiscardChanges(const wxString& action) {
    if (!m_dataManager.hasUnsavedChanges())
        return true;
    wxMessageDialog dialog(this, "The table has unsaved changes. Save them first?",
                           action + ": Unsaved Changes", wxYES_NO | wxCANCEL | wxICON_QUESTION);
    dialog.SetYesNoCancelLabels("&Save", "&Discard", "&Cancel");
    int answer = dialog.ShowModal();
    if (answer == wxID_CANCEL)
        return false;
    if (answer == wxID_YES)
        return SaveCurrent();
    return true;
}

void MainFrame::OnClose(wxCloseEvent& event) {
    if (event.CanVeto() && !ConfirmDiscardChanges("Quit")) {
        event.Veto();
        return;
    }
    event.Skip();
}

void MainFrame::OnAbout(wxCommandEvent& event) {
    wxMessageBox(
        "Tracemark\n\n"
        "Segmented time-series viewer for CSV tables\n"
        "with categorical backgrounds, markers\n"
        "and range labelling\n\n"
        "wxWidgets + WebGPU",
        "About Tracemark", wxOK | wxICON_INFORMATION, this);
}
