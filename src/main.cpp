#include "setup_window.hpp"

#include <curl/curl.h>

#include <gtkmm.h>

int main(int argc, char* argv[])
{
    curl_global_init(CURL_GLOBAL_DEFAULT);
    auto app = Gtk::Application::create("org.teddycloud.setup");
    int status = app->make_window_and_run<SetupWindow>(argc, argv);
    curl_global_cleanup();
    return status;
}
