// tests/CompletionConfigTest.cpp
#include <gtest/gtest.h>
#include <QSettings>
#include <QTemporaryDir>
#include "completion/CompletionConfig.hpp"

namespace {

class CompletionConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(dir.isValid());
        path = dir.filePath("inkassist.ini");
    }

    QTemporaryDir dir;
    QString path;
};

}

TEST_F(CompletionConfigTest, EmptyFileGivesDefaults) {
    QSettings s(path, QSettings::IniFormat);
    QStringList warnings;
    const CompletionConfig c = CompletionConfig::load(s, &warnings);

    EXPECT_TRUE(warnings.isEmpty());
    EXPECT_EQ(c.mode, CompletionMode::ManualOnly);
    EXPECT_EQ(c.baseTimeoutMs, 15000);
    EXPECT_EQ(c.minTimeoutMs, 8000);
    EXPECT_EQ(c.maxTimeoutMs, 30000);
    EXPECT_EQ(c.historyCapacity, 50);
    EXPECT_EQ(c.debounceMs, 300);
    EXPECT_DOUBLE_EQ(c.programmaticThreshold, 0.7);
    EXPECT_EQ(c.manualShortcut, "Ctrl+Space");
    EXPECT_EQ(c.contextBeforeChars, 500);
    EXPECT_EQ(c.contextAfterChars, 100);
    EXPECT_TRUE(c.overlayEnabled);
    EXPECT_TRUE(c.popupEnabled);
    EXPECT_EQ(c.provider.kind, "process");
}

TEST_F(CompletionConfigTest, InconsistentValuesAreRepaired) {
    {
        QSettings s(path, QSettings::IniFormat);
        s.setValue("completion/mode", "AUTO");
        s.setValue("timeout/min_ms", 40000);
        s.setValue("timeout/max_ms", 9000);
        s.setValue("timeout/history_capacity", 0);
        s.setValue("trigger/programmatic_threshold", 1.5);
        s.setValue("provider/kind", "grpc");
        s.sync();
    }
    QSettings s(path, QSettings::IniFormat);
    QStringList warnings;
    const CompletionConfig c = CompletionConfig::load(s, &warnings);

    EXPECT_EQ(c.mode, CompletionMode::AutoAssist);
    EXPECT_EQ(c.minTimeoutMs, 9000);
    EXPECT_EQ(c.maxTimeoutMs, 40000);
    EXPECT_EQ(c.historyCapacity, 50);
    EXPECT_DOUBLE_EQ(c.programmaticThreshold, 1.0);
    EXPECT_EQ(c.provider.kind, "process");
    EXPECT_EQ(warnings.size(), 4);
}

TEST_F(CompletionConfigTest, UnknownModeFallsBackToManual) {
    {
        QSettings s(path, QSettings::IniFormat);
        s.setValue("completion/mode", "sometimes");
        s.sync();
    }
    QSettings s(path, QSettings::IniFormat);
    QStringList warnings;
    const CompletionConfig c = CompletionConfig::load(s, &warnings);
    EXPECT_EQ(c.mode, CompletionMode::ManualOnly);
    ASSERT_EQ(warnings.size(), 1);
    EXPECT_TRUE(warnings.first().contains("sometimes"));
}

TEST_F(CompletionConfigTest, NormalizeLeavesValidConfigAlone) {
    CompletionConfig c;
    c.programmaticThreshold = 0.25;
    c.debounceMs = 0;
    EXPECT_TRUE(c.normalize().isEmpty());
    EXPECT_DOUBLE_EQ(c.programmaticThreshold, 0.25);
    EXPECT_EQ(c.debounceMs, 0);

    c.programmaticThreshold = 0.0;
    c.debounceMs = -5;
    EXPECT_EQ(c.normalize().size(), 2);
    EXPECT_DOUBLE_EQ(c.programmaticThreshold, 0.7);
    EXPECT_EQ(c.debounceMs, 0);
}

TEST_F(CompletionConfigTest, SaveThenLoadKeepsValues) {
    CompletionConfig original;
    original.mode = CompletionMode::Disabled;
    original.baseTimeoutMs = 12000;
    original.debounceMs = 450;
    original.manualShortcut = "Ctrl+J";
    original.popupEnabled = false;
    original.provider.kind = "http";
    original.provider.endpoint = "http://localhost:8080/v1/chat/completions";
    original.provider.arguments = QStringList{"--fast", "--quiet"};
    original.provider.temperature = 0.2;
    {
        QSettings s(path, QSettings::IniFormat);
        original.save(s);
        s.sync();
        ASSERT_EQ(s.status(), QSettings::NoError);
    }
    QSettings s(path, QSettings::IniFormat);
    const CompletionConfig c = CompletionConfig::load(s);
    EXPECT_EQ(c.mode, CompletionMode::Disabled);
    EXPECT_EQ(c.baseTimeoutMs, 12000);
    EXPECT_EQ(c.debounceMs, 450);
    EXPECT_EQ(c.manualShortcut, "Ctrl+J");
    EXPECT_FALSE(c.popupEnabled);
    EXPECT_EQ(c.provider.kind, "http");
    EXPECT_EQ(c.provider.endpoint, original.provider.endpoint);
    EXPECT_EQ(c.provider.arguments, original.provider.arguments);
    EXPECT_DOUBLE_EQ(c.provider.temperature, 0.2);
}
