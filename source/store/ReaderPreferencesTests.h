#ifndef READERPREFERENCESTESTS_H
#define READERPREFERENCESTESTS_H

#include <QObject>
#include <QSettings>
#include <QSignalSpy>
#include <QTemporaryDir>
#include <QTest>

#include "ReaderPreferences.h"
#include "PositionStore.h"

/**
 * Unit tests for ReaderPreferences and SettingsPositionStore.
 * Run with: quire --test-preferences
 */
class ReaderPreferencesTests : public QObject {
    Q_OBJECT

private slots:
    void testDefaults() {
        QTemporaryDir dir;
        SettingsPositionStore store(dir.filePath("prefs.ini"));
        ReaderPreferences prefs(&store);

        QVERIFY(prefs.scrollWithVolume());
        QVERIFY(prefs.ttsLock());
        QVERIFY(prefs.textFont().isEmpty());
        QCOMPARE(prefs.textSize(), 14);
        QCOMPARE(prefs.orientation(), 0);
        QCOMPARE(prefs.textColor(), static_cast<int>(0xFFCCCCCC));
        QCOMPARE(prefs.backgroundColor(), static_cast<int>(0xFF121212));
        QVERIFY(prefs.showBattery());
        QVERIFY(prefs.showTime());
        QVERIFY(prefs.screenAwake());

        QVERIFY(!ReaderPreferences::defaultValue("noSuchKey").isValid());
    }

    void testSetEmitsOnlyOnChange() {
        QTemporaryDir dir;
        SettingsPositionStore store(dir.filePath("prefs.ini"));
        ReaderPreferences prefs(&store);

        QSignalSpy sizeSpy(&prefs, &ReaderPreferences::textSizeChanged);
        QSignalSpy fontSpy(&prefs, &ReaderPreferences::textFontChanged);

        prefs.setTextSize(14);
        QCOMPARE(sizeSpy.count(), 0);

        prefs.setTextSize(18);
        prefs.setTextSize(18);
        QCOMPARE(sizeSpy.count(), 1);
        QCOMPARE(sizeSpy.first().at(0).toInt(), 18);
        QCOMPARE(prefs.textSize(), 18);

        prefs.setTextFont("serif");
        QCOMPARE(fontSpy.count(), 1);
        QCOMPARE(store.value(ReaderPreferences::SCOPE, ReaderPreferences::TEXT_FONT).toString(),
                 QString("serif"));
    }

    void testValuesSurviveReopen() {
        QTemporaryDir dir;
        const QString path = dir.filePath("prefs.ini");
        {
            SettingsPositionStore store(path);
            ReaderPreferences prefs(&store);
            prefs.setTextSize(22);
            prefs.setShowTime(false);
            prefs.setTextColor(static_cast<int>(0xFF00FF00));
            prefs.setBackgroundColor(static_cast<int>(0xFFFFFFFF));
            prefs.setOrientation(2);
            prefs.setScrollWithVolume(false);
            prefs.setTtsLock(false);
            prefs.setShowBattery(false);
        }

        // Read back as INI strings, converted to the default's type
        SettingsPositionStore store(path);
        ReaderPreferences prefs(&store);
        QCOMPARE(prefs.textSize(), 22);
        QVERIFY(!prefs.showTime());
        QCOMPARE(prefs.textColor(), static_cast<int>(0xFF00FF00));
        QCOMPARE(prefs.backgroundColor(), static_cast<int>(0xFFFFFFFF));
        QCOMPARE(prefs.orientation(), 2);
        QVERIFY(!prefs.scrollWithVolume());
        QVERIFY(!prefs.ttsLock());
        QVERIFY(!prefs.showBattery());
        QVERIFY(prefs.screenAwake());

        QSignalSpy sizeSpy(&prefs, &ReaderPreferences::textSizeChanged);
        prefs.setTextSize(22);
        QCOMPARE(sizeSpy.count(), 0);
    }

    void testResetValue() {
        QTemporaryDir dir;
        SettingsPositionStore store(dir.filePath("prefs.ini"));
        ReaderPreferences prefs(&store);

        prefs.setScreenAwake(false);
        QSignalSpy awakeSpy(&prefs, &ReaderPreferences::screenAwakeChanged);

        prefs.resetValue(ReaderPreferences::SCREEN_AWAKE);
        QVERIFY(prefs.screenAwake());
        QCOMPARE(awakeSpy.count(), 1);
        QVERIFY(!store.value(ReaderPreferences::SCOPE, ReaderPreferences::SCREEN_AWAKE).isValid());

        // Already at the default
        prefs.resetValue(ReaderPreferences::SCREEN_AWAKE);
        QCOMPARE(awakeSpy.count(), 1);

        prefs.resetValue("noSuchKey");
    }

    void testPositionLayout() {
        QTemporaryDir dir;
        const QString path = dir.filePath("positions.ini");
        {
            SettingsPositionStore store(path);
            QCOMPARE(store.chapterIndex("Untouched", 7), 7);
            QCOMPARE(store.charOffset("Untouched", -1), -1);

            store.savePosition("A/B Book", 4, 120);
            QCOMPARE(store.chapterIndex("A/B Book"), 4);
            QCOMPARE(store.charOffset("A/B Book"), 120);
        }

        QSettings raw(path, QSettings::IniFormat);
        QCOMPARE(raw.value("position/A_B Book/chapterIndex").toInt(), 4);
        QCOMPARE(raw.value("position/A_B Book/charOffset").toInt(), 120);
    }
};

#endif // READERPREFERENCESTESTS_H
