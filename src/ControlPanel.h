// Tracemark (MIT License) - See LICENSE file
#pragma once

#include <wx/wx.h>
#include <wx/spinctrl.h>
#include <vector>
#include <string>
#include <optional>
#include <functional>

// Entry shown in column and value choices when nothing is chosen
extern const char* const kNoneChoice;

// Side panel: series columns, background category, markers, segment navigation
class ControlPanel : public wxPanel {
public:
    explicit ControlPanel(wxWindow* parent);

    // Repopulates every column list and resets value choices
    void SetColumns(const std::vector<std::string>& names);

    // Distinct values of the current background / marker column, or nullopt
    // when the column has too many to list (free text entry is shown instead)
    void SetBackgroundValues(const std::optional<std::vector<std::string>>& values);
    void SetMarkerValues(const std::optional<std::vector<std::string>>& values);
    // Refreshes the assign-value list, keeping the typed or chosen text
    void SetAssignValues(const std::optional<std::vector<std::string>>& values);

    void SetSegmentInfo(size_t index, size_t count);
    void SetSelectionText(const wxString& text);
    // Apply button and assign-value box follow whether a range is pending
    void SetSelectionPending(bool pending);

    std::vector<size_t> GetSeriesColumns() const;
    std::optional<size_t> GetBackgroundColumn() const;
    std::optional<std::string> GetNoBackgroundValue() const;
    std::string GetAssignValue() const;
    std::optional<size_t> GetMarkerColumn() const;
    std::optional<std::string> GetMarkerValue() const;

    std::function<void()> onPlot;
    std::function<void(std::optional<size_t> column)> onBackgroundColumnChanged;
    std::function<void(std::optional<size_t> column)> onMarkerColumnChanged;
    std::function<void()> onApplyToSelection;
    std::function<void()> onPrevSegment;
    std::function<void()> onNextSegment;
    std::function<void(size_t index)> onGoToSegment;

private:
    wxStaticText* AddGroupHeader(wxWindow* parent, wxSizer* sizer, const wxString& text);
    static void FillValueChoice(wxChoice* choice, const std::vector<std::string>& values);
    static std::optional<std::string> ReadValue(const wxChoice* choice, const wxTextCtrl* text);
    static std::optional<size_t> ColumnFromChoice(const wxChoice* choice);

    bool m_suppress = false;

    wxListBox* m_seriesList = nullptr;

    wxChoice* m_bgColumn = nullptr;
    wxChoice* m_noBgChoice = nullptr;
    wxTextCtrl* m_noBgText = nullptr;
    wxComboBox* m_assignValue = nullptr;
    wxButton* m_applyButton = nullptr;
    wxStaticText* m_selectionLabel = nullptr;

    wxChoice* m_markerColumn = nullptr;
    wxChoice* m_markerChoice = nullptr;
    wxTextCtrl* m_markerText = nullptr;

    wxButton* m_prevButton = nullptr;
    wxButton* m_nextButton = nullptr;
    wxStaticText* m_segmentLabel = nullptr;
    wxSpinCtrl* m_segmentSpin = nullptr;
};
