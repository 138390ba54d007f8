#include <QCoreApplication>
#include <QStandardPaths>
#include <catch2/catch_session.hpp>

int main(int argc, char** argv) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName("offgrid");
    QCoreApplication::setOrganizationDomain("offgrid.local");
    QCoreApplication::setApplicationName("offgrid_tests");
    QStandardPaths::setTestModeEnabled(true);
    Catch::Session session;
    return session.run(argc, argv);
}
