// Tracemark (MIT License) - See LICENSE file
#pragma once

#include <wx/grid.h>

class DataManager;

// Read-only virtual table over the loaded dataset. Rows are labelled with
// their absolute index; nothing is copied into the grid.
class DataGridTable : public wxGridTableBase {
public:
    explicit DataGridTable(const DataManager& data);

    int GetNumberRows() override;
    int GetNumberCols() override;
    wxString GetValue(int row, int col) override;
    void SetValue(int row, int col, const wxString& value) override;
    bool IsEmptyCell(int row, int col) override;
    wxString GetColLabelValue(int col) override;
    wxString GetRowLabelValue(int row) override;

    // Tells the attached grid that the row/column counts changed
    void NotifyShapeChanged(int oldRows, int oldCols);

private:
    const DataManager& m_data;
};
