#include "roix/ansi.hpp"
#include "roix/app.hpp"
#include "roix/log.hpp"

int main()
{
    roix::log::init_from_env();
    roix::ansi::enable_virtual_terminal_on_windows();
    roix::app::Application app;
    return app.run();
}
