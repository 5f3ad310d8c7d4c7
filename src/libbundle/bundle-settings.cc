#include "charx/bundle/bundle-settings.hh"
#include "charx/util/config-global.hh"
#include "charx/util/error.hh"

#include <cstdlib>

namespace charx {

BundleSettings bundleSettings;

static GlobalConfig::Register rBundleSettings(&bundleSettings);

Path getDataDir()
{
    if (!bundleSettings.dataDir.get().empty())
        return bundleSettings.dataDir;
    if (auto xdg = getenv("XDG_DATA_HOME"); xdg && *xdg)
        return std::string(xdg) + "/charx";
    auto home = getenv("HOME");
    if (!home || !*home)
        throw Error("cannot determine the data directory; set 'data-dir' or $HOME");
    return std::string(home) + "/.local/share/charx";
}

} // namespace charx
