#include <QCoreApplication>
#include <QDebug>
#include <QStringList>

#include "src/free_list_test.h"
#include "src/pool_test.h"
#include "src/pool_bench.h"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    if (app.arguments().contains(QStringLiteral("--bench"))) {
        return run_pool_bench();
    }

    int failed = 0;

    qDebug() << "\n" << "free_list test";
    failed += run_tst_free_list_api_paranoid(argc, argv);

    qDebug() << "\n" << "pool test";
    failed += run_tst_pool_api_paranoid(argc, argv);

    if (failed != 0) {
        qWarning().noquote() << "[lfpool_tests]" << failed << "test function(s) failed";
    }
    return failed;
}
