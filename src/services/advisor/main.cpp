#include "advisor_service.h"
#include "core/shared/settings_manager.h"

#include <QCoreApplication>

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("phoneadvisor-service"));
    app.setApplicationVersion(QStringLiteral("0.1.0"));

    pa::AdvisorService service(pa::SettingsManager::loadOrDefault());
    return service.run();
}
