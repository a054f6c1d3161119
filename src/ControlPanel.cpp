// Tracemark (MIT License) - See LICENSE file
#include "ControlPanel.h"
#include "CategoryIndex.h"
#include <wx/statline.h>
#include <algorithm>

const char* const kNoneChoice = "(none)";

ControlPanel::ControlPanel(wxWindow* parent)
    : wxPanel(parent, wxID_ANY, wxDefaultPosition, wxSize(280, -1))
{
    SetMinSize(wxSize(280, -1));

    auto* sizer = new wxBoxSizer(wxVERTICAL);

    auto* title = new wxStaticText(this, wxID_ANY, "Plot Setup");
    auto titleFont = title->GetFont();
    titleFont.SetWeight(wxFONTWEIGHT_BOLD);
    titleFont.SetPointSize(titleFont.GetPointSize() + 2);
    title->SetFont(titleFont);
    sizer->Add(title, 0, wxALL, 8);

    auto* content = new wxScrolledWindow(this);
    content->SetScrollRate(0, 10);
    auto* cs = new wxBoxSizer(wxVERTICAL);

    // Series
    AddGroupHeader(content, cs, "Series (continuous)");
    m_seriesList = new wxListBox(content, wxID_ANY, wxDefaultPosition, wxSize(-1, 110),
                                 0, nullptr, wxLB_MULTIPLE | wxLB_NEEDED_SB);
    cs->Add(m_seriesList, 0, wxEXPAND | wxLEFT | wxRIGHT, 8);

    cs->Add(new wxStaticLine(content), 0, wxEXPAND | wxALL, 8);

    // Background
    AddGroupHeader(content, cs, "Background (categorical)");
    cs->Add(new wxStaticText(content, wxID_ANY, "Column"), 0, wxLEFT | wxTOP, 8);
    m_bgColumn = new wxChoice(content, wxID_ANY);
    cs->Add(m_bgColumn, 0, wxEXPAND | wxLEFT | wxRIGHT, 8);

    cs->Add(new wxStaticText(content, wxID_ANY, "No background"), 0, wxLEFT | wxTOP, 8);
    m_noBgChoice = new wxChoice(content, wxID_ANY);
    cs->Add(m_noBgChoice, 0, wxEXPAND | wxLEFT | wxRIGHT, 8);
    m_noBgText = new wxTextCtrl(content, wxID_ANY);
    m_noBgText->SetHint("Enter no-background value...");
    m_noBgText->Hide();
    cs->Add(m_noBgText, 0, wxEXPAND | wxLEFT | wxRIGHT, 8);

    auto* editHint = new wxStaticText(content, wxID_ANY, "Right-click + drag on plot to select range");
    editHint->SetForegroundColour(wxColour(102, 102, 102));
    auto ehFont = editHint->GetFont();
    ehFont.SetStyle(wxFONTSTYLE_ITALIC);
    ehFont.SetPointSize(ehFont.GetPointSize() - 1);
    editHint->SetFont(ehFont);
    cs->Add(editHint, 0, wxLEFT | wxTOP, 8);

    cs->Add(new wxStaticText(content, wxID_ANY, "Assign value"), 0, wxLEFT | wxTOP, 8);
    m_assignValue = new wxComboBox(content, wxID_ANY);
    m_assignValue->SetHint("Select or enter new value...");
    m_assignValue->Enable(false);
    cs->Add(m_assignValue, 0, wxEXPAND | wxLEFT | wxRIGHT, 8);

    m_applyButton = new wxButton(content, wxID_ANY, "Apply to selection");
    m_applyButton->Enable(false);
    cs->Add(m_applyButton, 0, wxEXPAND | wxLEFT | wxRIGHT | wxTOP, 8);

    m_selectionLabel = new wxStaticText(content, wxID_ANY, "No selection");
    m_selectionLabel->SetForegroundColour(wxColour(102, 102, 102));
    cs->Add(m_selectionLabel, 0, wxLEFT | wxTOP, 8);

    cs->Add(new wxStaticLine(content), 0, wxEXPAND | wxALL, 8);

    // Markers
    AddGroupHeader(content, cs, "Markers (vertical)");
    cs->Add(new wxStaticText(content, wxID_ANY, "Column"), 0, wxLEFT | wxTOP, 8);
    m_markerColumn = new wxChoice(content, wxID_ANY);
    cs->Add(m_markerColumn, 0, wxEXPAND | wxLEFT | wxRIGHT, 8);
    cs->Add(new wxStaticText(content, wxID_ANY, "Value"), 0, wxLEFT | wxTOP, 8);
    m_markerChoice = new wxChoice(content, wxID_ANY);
    cs->Add(m_markerChoice, 0, wxEXPAND | wxLEFT | wxRIGHT, 8);
    m_markerText = new wxTextCtrl(content, wxID_ANY);
    m_markerText->SetHint("Enter value...");
    m_markerText->Hide();
    cs->Add(m_markerText, 0, wxEXPAND | wxLEFT | wxRIGHT, 8);

    cs->Add(new wxStaticLine(content), 0, wxEXPAND | wxALL, 8);

    // Segment navigation
    AddGroupHeader(content, cs, "Segment");
    auto* navSizer = new wxBoxSizer(wxHORIZONTAL);
    m_prevButton = new wxButton(content, wxID_ANY, "<", wxDefaultPosition, wxSize(32, -1));
    m_segmentLabel = new wxStaticText(content, wxID_ANY, "1 / 1", wxDefaultPosition,
                                      wxDefaultSize, wxALIGN_CENTRE_HORIZONTAL | wxST_NO_AUTORESIZE);
    m_nextButton = new wxButton(content, wxID_ANY, ">", wxDefaultPosition, wxSize(32, -1));
    navSizer->Add(m_prevButton, 0);
    navSizer->Add(m_segmentLabel, 1, wxALIGN_CENTER_VERTICAL | wxLEFT | wxRIGHT, 4);
    navSizer->Add(m_nextButton, 0);
    cs->Add(navSizer, 0, wxEXPAND | wxLEFT | wxRIGHT | wxTOP, 8);

    auto* gotoSizer = new wxBoxSizer(wxHORIZONTAL);
    gotoSizer->Add(new wxStaticText(content, wxID_ANY, "Go to:"), 0, wxALIGN_CENTER_VERTICAL | wxRIGHT, 4);
    m_segmentSpin = new wxSpinCtrl(content, wxID_ANY, "1", wxDefaultPosition, wxDefaultSize,
                                   wxSP_ARROW_KEYS, 1, 1, 1);
    gotoSizer->Add(m_segmentSpin, 1);
    cs->Add(gotoSizer, 0, wxEXPAND | wxLEFT | wxRIGHT | wxTOP, 8);

    cs->Add(new wxStaticLine(content), 0, wxEXPAND | wxALL, 8);

    auto* plotButton = new wxButton(content, wxID_ANY, "Plot", wxDefaultPosition, wxSize(-1, 34));
    cs->Add(plotButton, 0, wxEXPAND | wxLEFT | wxRIGHT | wxBOTTOM, 8);

    content->SetSizer(cs);
    sizer->Add(content, 1, wxEXPAND);

    sizer->Add(new wxStaticLine(this), 0, wxEXPAND | wxALL, 4);

    auto* helpText = new wxStaticText(this, wxID_ANY,
        "Left/middle drag: pan\n"
        "Scroll: zoom X\n"
        "Ctrl+scroll: zoom Y\n"
        "Right drag: select rows\n"
        "Double-click / Esc: plot only\n"
        "R: reset view\n"
        "Ctrl+S: save");
    helpText->SetForegroundColour(wxColour(120, 120, 120));
    auto hFont = helpText->GetFont();
    hFont.SetPointSize(hFont.GetPointSize() - 1);
    helpText->SetFont(hFont);
    sizer->Add(helpText, 0, wxALL, 8);

    SetSizer(sizer);

    SetColumns({});

    m_bgColumn->Bind(wxEVT_CHOICE, [this](wxCommandEvent&) {
        if (m_suppress) return;
        if (onBackgroundColumnChanged) onBackgroundColumnChanged(ColumnFromChoice(m_bgColumn));
    });
    m_markerColumn->Bind(wxEVT_CHOICE, [this](wxCommandEvent&) {
        if (m_suppress) return;
        if (onMarkerColumnChanged) onMarkerColumnChanged(ColumnFromChoice(m_markerColumn));
    });
    m_applyButton->Bind(wxEVT_BUTTON, [this](wxCommandEvent&) {
        if (onApplyToSelection) onApplyToSelection();
    });
    m_prevButton->Bind(wxEVT_BUTTON, [this](wxCommandEvent&) {
        if (onPrevSegment) onPrevSegment();
    });
    m_nextButton->Bind(wxEVT_BUTTON, [this](wxCommandEvent&) {
        if (onNextSegment) onNextSegment();
    });
    m_segmentSpin->Bind(wxEVT_SPINCTRL, [this](wxSpinEvent& evt) {
        if (m_suppress) return;
        int value = std::max(1, evt.GetPosition());
        if (onGoToSegment) onGoToSegment(static_cast<size_t>(value - 1));
    });
    plotButton->Bind(wxEVT_BUTTON, [this](wxCommandEvent&) {
        if (onPlot) onPlot();
    });
}

wxStaticText* ControlPanel::AddGroupHeader(wxWindow* parent, wxSizer* sizer, const wxString& text) {
    auto* header = new wxStaticText(parent, wxID_ANY, text);
    auto font = header->GetFont();
    font.SetWeight(wxFONTWEIGHT_BOLD);
    header->SetFont(font);
    sizer->Add(header, 0, wxLEFT | wxTOP, 8);
    return header;
}

void ControlPanel::FillValueChoice(wxChoice* choice, const std::vector<std::string>& values) {
    choice->Clear();
    choice->Append(kNoneChoice);
    for (const auto& v : SortedValues(values))
        choice->Append(wxString::FromUTF8(v));
    choice->SetSelection(0);
}

std::optional<std::string> ControlPanel::ReadValue(const wxChoice* choice, const wxTextCtrl* text) {
    if (choice->IsShown()) {
        int sel = choice->GetSelection();
        if (sel <= 0) return std::nullopt;
        return std::string(choice->GetString(sel).utf8_str());
    }
    wxString typed = text->GetValue();
    typed.Trim(true).Trim(false);
    if (typed.empty()) return std::nullopt;
    return std::string(typed.utf8_str());
}

std::optional<size_t> ControlPanel::ColumnFromChoice(const wxChoice* choice) {
    int sel = choice->GetSelection();
    if (sel <= 0) return std::nullopt;
    return static_cast<size_t>(sel - 1);
}

void ControlPanel::SetColumns(const std::vector<std::string>& names) {
    m_suppress = true;

    m_seriesList->Clear();
    for (const auto& name : names)
        m_seriesList->Append(wxString::FromUTF8(name));

    for (wxChoice* choice : {m_bgColumn, m_markerColumn}) {
        choice->Clear();
        choice->Append(kNoneChoice);
        for (const auto& name : names)
            choice->Append(wxString::FromUTF8(name));
        choice->SetSelection(0);
    }

    m_suppress = false;

    SetBackgroundValues(std::vector<std::string>());
    SetMarkerValues(std::vector<std::string>());
    m_assignValue->Clear();
    SetSelectionPending(false);
    SetSelectionText("No selection");
}

void ControlPanel::SetBackgroundValues(const std::optional<std::vector<std::string>>& values) {
    if (values) {
        FillValueChoice(m_noBgChoice, *values);
        m_noBgChoice->Show();
        m_noBgText->Hide();
    } else {
        m_noBgChoice->Hide();
        m_noBgText->Clear();
        m_noBgText->Show();
    }
    m_noBgChoice->GetParent()->Layout();
}

void ControlPanel::SetMarkerValues(const std::optional<std::vector<std::string>>& values) {
    if (values) {
        FillValueChoice(m_markerChoice, *values);
        m_markerChoice->Show();
        m_markerText->Hide();
    } else {
        m_markerChoice->Hide();
        m_markerText->Clear();
        m_markerText->Show();
    }
    m_markerChoice->GetParent()->Layout();
}

void ControlPanel::SetAssignValues(const std::optional<std::vector<std::string>>& values) {
    if (!values) return;
    wxString current = m_assignValue->GetValue();
    m_assignValue->Clear();
    for (const auto& v : SortedValues(*values))
        m_assignValue->Append(wxString::FromUTF8(v));
    m_assignValue->SetValue(current);
}

void ControlPanel::SetSegmentInfo(size_t index, size_t count) {
    size_t shown = std::max<size_t>(count, 1);
    m_segmentLabel->SetLabel(wxString::Format("%zu / %zu", index + 1, shown));
    m_suppress = true;
    m_segmentSpin->SetRange(1, static_cast<int>(shown));
    m_segmentSpin->SetValue(static_cast<int>(index + 1));
    m_suppress = false;
    m_prevButton->Enable(index > 0);
    m_nextButton->Enable(index + 1 < count);
}

void ControlPanel::SetSelectionText(const wxString& text) {
    m_selectionLabel->SetLabel(text);
}

void ControlPanel::SetSelectionPending(bool pending) {
    m_applyButton->Enable(pending);
    m_assignValue->Enable(pending);
}

std::vector<size_t> ControlPanel::GetSeriesColumns() const {
    wxArrayInt selections;
    m_seriesList->GetSelections(selections);
    std::vector<size_t> columns;
    for (int sel : selections)
        columns.push_back(static_cast<size_t>(sel));
    std::sort(columns.begin(), columns.end());
    return columns;
}

std::optional<size_t> ControlPanel::GetBackgroundColumn() const {
    return ColumnFromChoice(m_bgColumn);
}

std::optional<std::string> ControlPanel::GetNoBackgroundValue() const {
    return ReadValue(m_noBgChoice, m_noBgText);
}

std::string ControlPanel::GetAssignValue() const {
    wxString value = m_assignValue->GetValue();
    value.Trim(true).Trim(false);
    return std::string(value.utf8_str());
}

std::optional<size_t> ControlPanel::GetMarkerColumn() const {
    return ColumnFromChoice(m_markerColumn);
}

std::optional<std::string> ControlPanel::GetMarkerValue() const {
    if (!GetMarkerColumn()) return std::nullopt;
    return ReadValue(m_markerChoice, m_markerText);
}
