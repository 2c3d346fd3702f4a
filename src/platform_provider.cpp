#include "sysscope/platform_provider.hpp"

#include "sysscope/linux_provider.hpp"
#include "sysscope/logging.hpp"
#include "sysscope/windows_provider.hpp"

#include <QtGlobal>

namespace sysscope {

std::unique_ptr<PlatformProvider> makePlatformProvider(const Config& config) {
    std::unique_ptr<PlatformProvider> provider;
#if defined(Q_OS_WIN)
    provider = std::make_unique<WindowsPlatformProvider>(config);
#elif defined(Q_OS_LINUX)
    provider = std::make_unique<LinuxPlatformProvider>(config);
#else
    Q_UNUSED(config);
    provider = std::make_unique<NullPlatformProvider>();
#endif
    qCInfo(lcCollect) << "platform provider:" << provider->name().c_str();
    return provider;
}

} // namespace sysscope
