#include "scriptgate/renderer.h"

#include <iostream>
#include <sstream>

namespace scriptgate {

std::string render_denied_placeholder(const DenialReport& report) {
    std::ostringstream oss;
    oss << "Untrusted " << report.integration << " Code\n"
        << "This code block hash does not match any trusted hash.\n"
        << "Hash: " << report.digest << "\n";
    if (!report.location.empty()) oss << "Location: " << report.location << "\n";
    return oss.str();
}

void ConsoleRenderer::report_denied(const DenialReport& report) {
    std::cerr << "----\n" << render_denied_placeholder(report) << "----\n";
}

void RecordingRenderer::report_denied(const DenialReport& report) {
    std::lock_guard<std::mutex> lk(mu_);
    reports_.push_back(report);
}

void RecordingRenderer::rerender_all() {
    std::lock_guard<std::mutex> lk(mu_);
    rerenders_++;
}

std::vector<DenialReport> RecordingRenderer::reports() const {
    std::lock_guard<std::mutex> lk(mu_);
    return reports_;
}

size_t RecordingRenderer::rerender_count() const {
    std::lock_guard<std::mutex> lk(mu_);
    return rerenders_;
}

} // namespace scriptgate
