// Tracemark (MIT License) - See LICENSE file
#include "TracemarkApp.h"
#include "MainFrame.h"
#include <wx/cmdline.h>

wxIMPLEMENT_APP(TracemarkApp);

void TracemarkApp::OnInitCmdLine(wxCmdLineParser& parser) {
    wxApp::OnInitCmdLine(parser);
    parser.AddOption("i", "input-file", "Data file to load on startup",
                     wxCMD_LINE_VAL_STRING, wxCMD_LINE_PARAM_OPTIONAL);
    parser.AddOption("n", "number-of-rows", "Maximum number of rows to read",
                     wxCMD_LINE_VAL_NUMBER, wxCMD_LINE_PARAM_OPTIONAL);
    parser.AddOption("c", "chunk-size", "Rows per segment for large tables",
                     wxCMD_LINE_VAL_NUMBER, wxCMD_LINE_PARAM_OPTIONAL);
    parser.AddOption("t", "chunk-threshold", "Row count above which tables are segmented",
                     wxCMD_LINE_VAL_NUMBER, wxCMD_LINE_PARAM_OPTIONAL);
    parser.AddParam("input file", wxCMD_LINE_VAL_STRING, wxCMD_LINE_PARAM_OPTIONAL);
}

bool TracemarkApp::OnCmdLineParsed(wxCmdLineParser& parser) {
    wxString val;
    if (parser.Found("i", &val)) {
        m_inputFile = val;
    } else if (parser.GetParamCount() > 0) {
        m_inputFile = parser.GetParam(0);
    }

    long number = 0;
    if (parser.Found("n", &number) && number > 0)
        m_config.maxRows = static_cast<size_t>(number);
    if (parser.Found("c", &number)) {
        if (number <= 0) {
            wxLogError("--chunk-size must be positive");
            return false;
        }
        m_config.chunkSize = static_cast<size_t>(number);
    }
    if (parser.Found("t", &number)) {
        if (number < 0) {
            wxLogError("--chunk-threshold must not be negative");
            return false;
        }
        m_config.chunkThreshold = static_cast<size_t>(number);
    }
    return wxApp::OnCmdLineParsed(parser);
}

bool TracemarkApp::OnInit() {
    if (!wxApp::OnInit())
        return false;

    auto* frame = new MainFrame(m_config);
    frame->Show();

    if (!m_inputFile.empty()) {
        frame->LoadFileFromPath(m_inputFile.ToStdString());
    }

    return true;
}
