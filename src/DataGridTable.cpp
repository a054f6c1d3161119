// Tracemark (MIT License) - See LICENSE file
#include "DataGridTable.h"
#include "DataManager.h"

DataGridTable::DataGridTable(const DataManager& data)
    : m_data(data)
{
}

int DataGridTable::GetNumberRows() {
    return static_cast<int>(m_data.dataset().numRows);
}

int DataGridTable::GetNumberCols() {
    return static_cast<int>(m_data.dataset().numCols);
}

wxString DataGridTable::GetValue(int row, int col) {
    const auto& ds = m_data.dataset();
    if (row < 0 || col < 0 || static_cast<size_t>(row) >= ds.numRows ||
        static_cast<size_t>(col) >= ds.numCols)
        return wxEmptyString;
    return wxString::FromUTF8(ds.text(row, col));
}

void DataGridTable::SetValue(int, int, const wxString&) {
    // Edits go through range selection, not the grid
}

bool DataGridTable::IsEmptyCell(int row, int col) {
    const auto& ds = m_data.dataset();
    if (row < 0 || col < 0 || static_cast<size_t>(row) >= ds.numRows ||
        static_cast<size_t>(col) >= ds.numCols)
        return true;
    return ds.text(row, col).empty();
}

wxString DataGridTable::GetColLabelValue(int col) {
    const auto& ds = m_data.dataset();
    if (col < 0 || static_cast<size_t>(col) >= ds.numCols)
        return wxEmptyString;
    return wxString::FromUTF8(ds.columnLabels[col]);
}

wxString DataGridTable::GetRowLabelValue(int row) {
    return wxString::Format("%d", row);
}

void DataGridTable::NotifyShapeChanged(int oldRows, int oldCols) {
    wxGrid* grid = GetView();
    if (!grid) return;

    grid->BeginBatch();
    int newRows = GetNumberRows();
    int newCols = GetNumberCols();
    if (newRows < oldRows) {
        wxGridTableMessage msg(this, wxGRIDTABLE_NOTIFY_ROWS_DELETED, newRows, oldRows - newRows);
        grid->ProcessTableMessage(msg);
    } else if (newRows > oldRows) {
        wxGridTableMessage msg(this, wxGRIDTABLE_NOTIFY_ROWS_APPENDED, newRows - oldRows);
        grid->ProcessTableMessage(msg);
    }
    if (newCols < oldCols) {
        wxGridTableMessage msg(this, wxGRIDTABLE_NOTIFY_COLS_DELETED, newCols, oldCols - newCols);
        grid->ProcessTableMessage(msg);
    } else if (newCols > oldCols) {
        wxGridTableMessage msg(this, wxGRIDTABLE_NOTIFY_COLS_APPENDED, newCols - oldCols);
        grid->ProcessTableMessage(msg);
    }
    grid->EndBatch();
    grid->ForceRefresh();
}
