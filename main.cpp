#include <csignal>

#include "app/TenderLensApp.hpp"

namespace {

tenderlens::app::TenderLensApp* g_app = nullptr;

extern "C" void HandleInterrupt(int) {
    if (g_app) g_app->requestCancel();
}

} // namespace

int main(int argc, char** argv) {
    tenderlens::app::TenderLensApp app;
    g_app = &app;
    std::signal(SIGINT, HandleInterrupt);
    std::signal(SIGTERM, HandleInterrupt);

    const int code = app.Run(argc, argv);
    g_app = nullptr;
    return code;
}
