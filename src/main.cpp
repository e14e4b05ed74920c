#include "app/app.hpp"
#include "app/settings/store.hpp"
#include "logger.hpp"

int main() {
    logger::info("Startup");
    app::App application(app::settings::store::default_dir());
    return application.run();
}
