#include <QtTest/QtTest>

#include "todo/domain/Title.hpp"

using todo::domain::Title;

class TitleTest : public QObject
{
    Q_OBJECT

private slots:
    void acceptsOrdinaryTitle();
    void keepsInputVerbatim();
    void rejectsBlank_data();
    void rejectsBlank();
    void enforcesMaximumLength();
};

void TitleTest::acceptsOrdinaryTitle()
{
    const auto title = Title::create(QStringLiteral("Buy milk"));
    QVERIFY(title.isOk());
    QCOMPARE(title.value().value(), QStringLiteral("Buy milk"));
}

void TitleTest::keepsInputVerbatim()
{
    const QString padded = QStringLiteral("  Call the plumber \t");
    const auto title = Title::create(padded);
    QVERIFY(title.isOk());
    QCOMPARE(title.value().value(), padded);
}

void TitleTest::rejectsBlank_data()
{
    QTest::addColumn<QString>("input");
    QTest::newRow("null") << QString();
    QTest::newRow("empty") << QStringLiteral("");
    QTest::newRow("spaces") << QStringLiteral("    ");
    QTest::newRow("mixed whitespace") << QStringLiteral(" \t\n\r ");
}

void TitleTest::rejectsBlank()
{
    QFETCH(QString, input);
    const auto title = Title::create(input);
    QVERIFY(title.isError());
    QCOMPARE(title.error().message, QStringLiteral("Title cannot be empty"));
}

void TitleTest::enforcesMaximumLength()
{
    const auto exact = Title::create(QString(Title::MaxLength, QLatin1Char('a')));
    QVERIFY(exact.isOk());
    QCOMPARE(exact.value().value().size(), 200);

    const auto tooLong = Title::create(QString(Title::MaxLength + 1, QLatin1Char('a')));
    QVERIFY(tooLong.isError());
    QCOMPARE(tooLong.error().message, QStringLiteral("Title cannot exceed 200 characters"));

    // Whitespace-only wins over length.
    const auto blankAndLong = Title::create(QString(300, QLatin1Char(' ')));
    QCOMPARE(blankAndLong.error().message, QStringLiteral("Title cannot be empty"));
}

QTEST_GUILESS_MAIN(TitleTest)
#include "TitleTest.moc"
