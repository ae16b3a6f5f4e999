#include <QApplication>

#include "client_app.h"

int main(int argc, char *argv[]) {
    QApplication app(argc, argv);
    QApplication::setApplicationName("gme-client");
    QApplication::setOrganizationName("GME");

    gme::ClientApp client;
    return client.run();
}
