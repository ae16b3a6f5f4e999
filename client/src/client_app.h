#pragma once
#include <memory>

#include "core/config.h"

class AppContext;
class MainWindow;
class Navigator;

namespace gme {

class ClientApp {
public:
    ClientApp();
    ~ClientApp();

    // runs the Qt event loop; a QApplication must exist
    int run();

private:
    void init_config();
    void init_logger();
    void init_ui();

private:
    Config m_config;
    std::unique_ptr<AppContext> m_ctx;
    std::unique_ptr<Navigator> m_nav;
    std::unique_ptr<MainWindow> m_window;
};

} // namespace gme
