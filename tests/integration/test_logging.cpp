#include <catch2/catch_test_macros.hpp>

#include <QFile>
#include <QTemporaryDir>

#include "app/config.hpp"
#include "app/logging.hpp"

using namespace tether;

TEST_CASE("Logging: lines carry level and category", "[logging]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const auto path = dir.filePath(QStringLiteral("logs/tether.log"));

    app::install_file_logging(path);
    qCWarning(tetherStoreLog) << "documents rolled back";
    qCInfo(tetherContextLog) << "signed in";
    qInstallMessageHandler(nullptr);

    QFile file(path);
    REQUIRE(file.open(QIODevice::ReadOnly | QIODevice::Text));
    const auto text = QString::fromUtf8(file.readAll());
    REQUIRE(text.contains(QStringLiteral(" W tether.store documents rolled back")));
    REQUIRE(text.contains(QStringLiteral(" I tether.context signed in")));
}

TEST_CASE("Logging: default path lives under app data", "[logging]") {
    const auto path = app::default_log_file_path();
    REQUIRE(path.endsWith(QStringLiteral("logs/tether.log")));
}

TEST_CASE("Logging: configured from the store config", "[logging]") {
    QTemporaryDir dir;
    app::StoreConfig config;
    config.log_file_path = dir.filePath(QStringLiteral("configured.log"));

    app::configure_logging(config);
    qCWarning(tetherBusLog) << "no subscribers";
    app::configure_logging(app::StoreConfig{});

    QFile file(config.log_file_path);
    REQUIRE(file.open(QIODevice::ReadOnly | QIODevice::Text));
    const auto text = QString::fromUtf8(file.readAll());
    REQUIRE(text.contains(QStringLiteral(" I tether.store logging to")));
    REQUIRE(text.contains(QStringLiteral(" W tether.bus no subscribers")));
}
