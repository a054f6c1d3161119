// Tracemark (MIT License) - See LICENSE file
#pragma once

#include <wx/wx.h>
#include <vector>
#include <algorithm>

// Horizontal strip under the plot listing series (line swatch) and
// background categories (filled patch). Entries wrap onto extra rows.
class LegendPanel : public wxPanel {
public:
    struct Entry {
        wxString label;
        wxColour colour;
        bool patch = false;   // filled patch instead of a line swatch
    };

    explicit LegendPanel(wxWindow* parent)
        : wxPanel(parent, wxID_ANY)
    {
        SetBackgroundColour(*wxWHITE);
        SetMinSize(wxSize(-1, kRowHeight + 4));
        Bind(wxEVT_PAINT, &LegendPanel::OnPaint, this);
        Bind(wxEVT_SIZE, [this](wxSizeEvent& e) { UpdateMinHeight(); Refresh(); e.Skip(); });
    }

    void SetEntries(const std::vector<Entry>& series, const std::vector<Entry>& background) {
        m_series = series;
        m_background = background;
        UpdateMinHeight();
        Refresh();
    }

    bool IsEmpty() const { return m_series.empty() && m_background.empty(); }

private:
    static constexpr int kRowHeight = 18;
    static constexpr int kSwatchWidth = 18;
    static constexpr int kGap = 6;
    static constexpr int kGroupGap = 24;

    // Walks the entries in paint order, calling fn(entry, x, y) for each
    template <typename Fn>
    int LayoutEntries(wxDC& dc, Fn fn) const {
        int width = std::max(GetClientSize().GetWidth(), 100);
        int x = kGap, y = 2;
        auto place = [&](const std::vector<Entry>& entries) {
            for (const auto& e : entries) {
                int w = kSwatchWidth + 4 + dc.GetTextExtent(e.label).GetWidth() + kGap * 2;
                if (x + w > width && x > kGap) {
                    x = kGap;
                    y += kRowHeight;
                }
                fn(e, x, y);
                x += w;
            }
        };
        place(m_series);
        if (!m_series.empty() && !m_background.empty())
            x += kGroupGap;
        place(m_background);
        return y + kRowHeight;
    }

    void UpdateMinHeight() {
        wxClientDC dc(this);
        dc.SetFont(LegendFont());
        int h = LayoutEntries(dc, [](const Entry&, int, int) {});
        if (h + 2 != GetMinSize().GetHeight()) {
            SetMinSize(wxSize(-1, h + 2));
            if (GetParent()) GetParent()->Layout();
        }
    }

    static wxFont LegendFont() {
        return wxFont(8, wxFONTFAMILY_SWISS, wxFONTSTYLE_NORMAL, wxFONTWEIGHT_NORMAL);
    }

    void OnPaint(wxPaintEvent&) {
        wxPaintDC dc(this);
        dc.SetBackground(wxBrush(GetBackgroundColour()));
        dc.Clear();
        dc.SetFont(LegendFont());
        dc.SetTextForeground(wxColour(40, 40, 40));

        LayoutEntries(dc, [&](const Entry& e, int x, int y) {
            int midY = y + kRowHeight / 2;
            if (e.patch) {
                dc.SetPen(wxPen(e.colour.ChangeLightness(80)));
                dc.SetBrush(wxBrush(e.colour));
                dc.DrawRectangle(x, midY - 5, kSwatchWidth, 10);
            } else {
                dc.SetPen(wxPen(e.colour, 2));
                dc.DrawLine(x, midY, x + kSwatchWidth, midY);
            }
            int textH = dc.GetTextExtent(e.label).GetHeight();
            dc.DrawText(e.label, x + kSwatchWidth + 4, midY - textH / 2);
        });
    }

    std::vector<Entry> m_series;
    std::vector<Entry> m_background;
};
