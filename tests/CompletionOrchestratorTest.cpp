// tests/CompletionOrchestratorTest.cpp
#include <gtest/gtest.h>
#include <memory>
#include "TestDoubles.hpp"
#include "completion/CompletionOrchestrator.hpp"

namespace {

const QString kTyped = "The cat sat on the ";
const QString kAnswer = "The cat sat on the mat.";

class CompletionOrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.mode = CompletionMode::AutoAssist;
        buffer = std::make_unique<MemoryBuffer>(kTyped);
        orchestrator = std::make_unique<CompletionOrchestrator>(buffer.get(), &provider, config);
        orchestrator->installDefaultChannels(&overlay, &popup);
        orchestrator->setClock([this] { return now; });
        QObject::connect(orchestrator.get(), &CompletionOrchestrator::statusChanged,
                         [this](CompletionStatus status, CompletionError error, const QString &) {
                             statuses.append(status);
                             errors.append(error);
                         });
    }

    quint64 lastSequence() const { return provider.requests.last().sequence; }

    // Runs the scenario up to a visible suggestion.
    void showSuggestion() {
        ASSERT_TRUE(orchestrator->request(TriggerKind::Manual));
        now += 700;
        provider.deliver(lastSequence(), kAnswer);
        ASSERT_TRUE(orchestrator->hasPendingSuggestion());
    }

    CompletionConfig config;
    FakeOverlayHost overlay;
    FakePopupHost popup;
    FakeProvider provider;
    std::unique_ptr<MemoryBuffer> buffer;
    std::unique_ptr<CompletionOrchestrator> orchestrator;
    qint64 now = 1000;
    QList<CompletionStatus> statuses;
    QList<CompletionError> errors;
};

}

TEST_F(CompletionOrchestratorTest, DebouncedAutoTriggerShowsRemainderAndAcceptCommits) {
    orchestrator->notifyKeystroke(" ");
    now = 1300;
    orchestrator->handleDebounceElapsed();

    ASSERT_EQ(provider.requests.size(), 1);
    const CompletionRequest &req = provider.requests.first();
    EXPECT_EQ(req.trigger, TriggerKind::Auto);
    EXPECT_EQ(req.textBeforeCursor, kTyped);
    EXPECT_EQ(req.cursorOffset, 19);
    EXPECT_EQ(orchestrator->state(), OrchestratorState::Requesting);
    EXPECT_EQ(orchestrator->status(), CompletionStatus::Requesting);

    now = 2000;
    provider.deliver(req.sequence, kAnswer);
    EXPECT_EQ(orchestrator->state(), OrchestratorState::Idle);
    EXPECT_EQ(orchestrator->status(), CompletionStatus::SuggestionReady);
    ASSERT_TRUE(orchestrator->hasPendingSuggestion());
    EXPECT_EQ(orchestrator->pendingSuggestion()->suggestedText, "mat.");
    EXPECT_EQ(orchestrator->pendingSuggestion()->anchorOffset, 19);
    EXPECT_EQ(overlay.shownText, "mat.");
    EXPECT_EQ(buffer->text(), kTyped);

    ASSERT_EQ(orchestrator->timeoutEstimator().history().size(), 1);
    EXPECT_EQ(orchestrator->timeoutEstimator().history().first().durationMs, 700);
    EXPECT_TRUE(orchestrator->timeoutEstimator().history().first().succeeded);

    QString accepted;
    QObject::connect(orchestrator.get(), &CompletionOrchestrator::suggestionAccepted,
                     [&accepted](const QString &text) { accepted = text; });
    EXPECT_TRUE(orchestrator->accept());
    EXPECT_EQ(buffer->text(), kAnswer);
    EXPECT_EQ(accepted, "mat.");
    EXPECT_EQ(orchestrator->state(), OrchestratorState::Idle);
    EXPECT_EQ(orchestrator->status(), CompletionStatus::Idle);
    EXPECT_FALSE(orchestrator->hasPendingSuggestion());
}

TEST_F(CompletionOrchestratorTest, TypingOverSuggestionDiscardsIt) {
    showSuggestion();
    buffer->type("x");
    const TriggerDecision d = orchestrator->notifyKeystroke("x");
    EXPECT_EQ(d.action, TriggerDecision::Action::Invalidate);
    EXPECT_FALSE(orchestrator->hasPendingSuggestion());
    EXPECT_EQ(buffer->text(), "The cat sat on the x");
    EXPECT_TRUE(overlay.shownText.isEmpty());
    EXPECT_EQ(orchestrator->status(), CompletionStatus::Idle);
    EXPECT_EQ(orchestrator->lastError(), CompletionError::None);
}

TEST_F(CompletionOrchestratorTest, TypingPastLiteralSuggestionRemovesIt) {
    overlay.available = false;
    popup.available = false;
    showSuggestion();
    buffer->type("x");
    EXPECT_EQ(buffer->text(), "The cat sat on the mat.x");

    const TriggerDecision d = orchestrator->notifyKeystroke("x");
    EXPECT_EQ(d.action, TriggerDecision::Action::Invalidate);
    EXPECT_FALSE(orchestrator->hasPendingSuggestion());
    EXPECT_EQ(buffer->text(), "The cat sat on the x");
    EXPECT_EQ(buffer->cursorOffset(), 20);
    EXPECT_EQ(orchestrator->lastError(), CompletionError::None);
}

TEST_F(CompletionOrchestratorTest, ExternalEditRemovesLiteralSuggestion) {
    overlay.available = false;
    popup.available = false;
    showSuggestion();
    buffer->type("x");
    orchestrator->notifyBufferChanged();
    EXPECT_FALSE(orchestrator->hasPendingSuggestion());
    EXPECT_EQ(buffer->text(), "The cat sat on the x");
    EXPECT_EQ(orchestrator->lastError(), CompletionError::AnchorMismatch);
}

TEST_F(CompletionOrchestratorTest, NonPrintableKeyEditIsAnchorMismatch) {
    showSuggestion();
    buffer->removeRange(18, 19);
    const TriggerDecision d = orchestrator->notifyKeystroke(QString(QChar(0x08)));
    EXPECT_EQ(d.action, TriggerDecision::Action::Suppress);
    EXPECT_FALSE(orchestrator->hasPendingSuggestion());
    EXPECT_EQ(orchestrator->lastError(), CompletionError::AnchorMismatch);
    EXPECT_EQ(buffer->text(), "The cat sat on the");
}

TEST_F(CompletionOrchestratorTest, BufferChangeUnderSuggestionIsAnchorMismatch) {
    showSuggestion();
    buffer->insertAt(0, "So ");
    orchestrator->notifyBufferChanged();
    EXPECT_FALSE(orchestrator->hasPendingSuggestion());
    EXPECT_EQ(orchestrator->lastError(), CompletionError::AnchorMismatch);
    EXPECT_EQ(buffer->text(), "So " + kTyped);

    CompletionError error = CompletionError::None;
    EXPECT_FALSE(orchestrator->accept(&error));
    EXPECT_EQ(error, CompletionError::NoSuggestion);
}

TEST_F(CompletionOrchestratorTest, CursorLeavingAnchorRejectsSuggestion) {
    showSuggestion();
    orchestrator->notifyCursorMoved();
    EXPECT_TRUE(orchestrator->hasPendingSuggestion());

    buffer->setCursorOffset(3);
    orchestrator->notifyCursorMoved();
    EXPECT_FALSE(orchestrator->hasPendingSuggestion());
    EXPECT_EQ(buffer->text(), kTyped);
}

TEST_F(CompletionOrchestratorTest, AtMostOneRequestInFlight) {
    EXPECT_TRUE(orchestrator->request(TriggerKind::Manual));
    EXPECT_FALSE(orchestrator->request(TriggerKind::Manual));
    EXPECT_FALSE(orchestrator->request(TriggerKind::Auto));
    now += 5000;
    orchestrator->notifyManualTrigger();
    orchestrator->handleDebounceElapsed();
    EXPECT_EQ(provider.requests.size(), 1);
    EXPECT_EQ(orchestrator->currentSequence(), 1u);
    EXPECT_EQ(orchestrator->state(), OrchestratorState::Requesting);
}

TEST_F(CompletionOrchestratorTest, CancelledRequestResultIsIgnored) {
    ASSERT_TRUE(orchestrator->request(TriggerKind::Manual));
    const quint64 first = lastSequence();
    EXPECT_TRUE(orchestrator->cancel());
    EXPECT_EQ(orchestrator->state(), OrchestratorState::Idle);

    ASSERT_TRUE(orchestrator->request(TriggerKind::Manual));
    const quint64 second = lastSequence();
    EXPECT_GT(second, first);

    provider.deliver(first, "The cat sat on the dog.");
    EXPECT_EQ(orchestrator->state(), OrchestratorState::Requesting);
    EXPECT_FALSE(orchestrator->hasPendingSuggestion());
    orchestrator->handleTimeout(first);
    EXPECT_EQ(orchestrator->state(), OrchestratorState::Requesting);

    provider.deliver(second, kAnswer);
    ASSERT_TRUE(orchestrator->hasPendingSuggestion());
    EXPECT_EQ(orchestrator->pendingSuggestion()->suggestedText, "mat.");
    // the cancelled attempt left no timing sample
    EXPECT_EQ(orchestrator->timeoutEstimator().history().size(), 1);
}

TEST_F(CompletionOrchestratorTest, TimeoutReturnsToIdleAndDropsLateResult) {
    ASSERT_TRUE(orchestrator->request(TriggerKind::Manual));
    const quint64 seq = lastSequence();
    now += 16500;
    orchestrator->handleTimeout(seq);

    EXPECT_EQ(orchestrator->state(), OrchestratorState::Idle);
    EXPECT_EQ(orchestrator->status(), CompletionStatus::Error);
    EXPECT_EQ(orchestrator->lastError(), CompletionError::TimeoutExceeded);
    ASSERT_EQ(orchestrator->timeoutEstimator().history().size(), 1);
    EXPECT_TRUE(orchestrator->timeoutEstimator().history().first().timedOut);
    EXPECT_FALSE(orchestrator->timeoutEstimator().history().first().succeeded);

    provider.deliver(seq, kAnswer);
    orchestrator->handleTimeout(seq);
    EXPECT_FALSE(orchestrator->hasPendingSuggestion());
    EXPECT_EQ(orchestrator->timeoutEstimator().history().size(), 1);
}

TEST_F(CompletionOrchestratorTest, DeadlineComesFromEstimator) {
    ASSERT_TRUE(orchestrator->request(TriggerKind::Manual));
    // base 15 s with the manual allowance
    EXPECT_EQ(orchestrator->currentDeadlineMs(), 16500);
}

TEST_F(CompletionOrchestratorTest, ProviderFailureRecordsFailedSample) {
    ASSERT_TRUE(orchestrator->request(TriggerKind::Manual));
    now += 300;
    provider.fail(lastSequence(), "model unavailable");
    EXPECT_EQ(orchestrator->state(), OrchestratorState::Idle);
    EXPECT_EQ(orchestrator->status(), CompletionStatus::Error);
    EXPECT_EQ(orchestrator->lastError(), CompletionError::ProviderError);
    ASSERT_EQ(orchestrator->timeoutEstimator().history().size(), 1);
    EXPECT_FALSE(orchestrator->timeoutEstimator().history().first().succeeded);
    EXPECT_FALSE(orchestrator->timeoutEstimator().history().first().timedOut);
}

TEST_F(CompletionOrchestratorTest, BlankResultCountsAsFailure) {
    ASSERT_TRUE(orchestrator->request(TriggerKind::Manual));
    provider.deliver(lastSequence(), "  \n ");
    EXPECT_EQ(orchestrator->lastError(), CompletionError::ProviderError);
    EXPECT_FALSE(orchestrator->hasPendingSuggestion());
    EXPECT_FALSE(orchestrator->timeoutEstimator().history().first().succeeded);
}

TEST_F(CompletionOrchestratorTest, AlreadyTypedResultLeavesNothingToShow) {
    ASSERT_TRUE(orchestrator->request(TriggerKind::Manual));
    provider.deliver(lastSequence(), kTyped);
    EXPECT_FALSE(orchestrator->hasPendingSuggestion());
    EXPECT_EQ(orchestrator->status(), CompletionStatus::Idle);
    EXPECT_EQ(orchestrator->lastError(), CompletionError::NoSuggestion);
    EXPECT_TRUE(orchestrator->timeoutEstimator().history().first().succeeded);
}

TEST_F(CompletionOrchestratorTest, CharactersTypedDuringRequestAreNotRepeated) {
    ASSERT_TRUE(orchestrator->request(TriggerKind::Manual));
    buffer->type("m");
    provider.deliver(lastSequence(), kAnswer);
    ASSERT_TRUE(orchestrator->hasPendingSuggestion());
    EXPECT_EQ(orchestrator->pendingSuggestion()->anchorOffset, 20);
    EXPECT_EQ(orchestrator->pendingSuggestion()->suggestedText, "at.");
}

TEST_F(CompletionOrchestratorTest, ResultDiscardedWhenCursorMovedAway) {
    ASSERT_TRUE(orchestrator->request(TriggerKind::Manual));
    buffer->setCursorOffset(4);
    provider.deliver(lastSequence(), kAnswer);
    EXPECT_FALSE(orchestrator->hasPendingSuggestion());
    EXPECT_EQ(orchestrator->status(), CompletionStatus::Idle);
    EXPECT_EQ(orchestrator->lastError(), CompletionError::AnchorMismatch);
    EXPECT_EQ(overlay.showCount, 0);
}

TEST_F(CompletionOrchestratorTest, LiteralFallbackRejectRestoresBuffer) {
    overlay.available = false;
    popup.available = false;
    bool rejected = false;
    QObject::connect(orchestrator.get(), &CompletionOrchestrator::suggestionRejected, [&rejected] { rejected = true; });

    showSuggestion();
    EXPECT_EQ(buffer->text(), kAnswer);
    EXPECT_EQ(orchestrator->pendingSuggestion()->activeChannel, "literal");

    EXPECT_TRUE(orchestrator->reject());
    EXPECT_TRUE(rejected);
    EXPECT_EQ(buffer->text(), kTyped);
    EXPECT_EQ(buffer->cursorOffset(), 19);
    EXPECT_FALSE(orchestrator->reject());
    EXPECT_EQ(buffer->text(), kTyped);
}

TEST_F(CompletionOrchestratorTest, NewManualTriggerReplacesPendingSuggestion) {
    showSuggestion();
    now += 1000;
    orchestrator->notifyManualTrigger();
    EXPECT_FALSE(orchestrator->hasPendingSuggestion());
    EXPECT_TRUE(overlay.shownText.isEmpty());
    EXPECT_EQ(provider.requests.size(), 2);
    EXPECT_EQ(orchestrator->state(), OrchestratorState::Requesting);
}

TEST_F(CompletionOrchestratorTest, ModeGatesRequests) {
    QList<CompletionMode> modes;
    QObject::connect(orchestrator.get(), &CompletionOrchestrator::modeChanged,
                     [&modes](CompletionMode mode) { modes.append(mode); });

    orchestrator->setMode(CompletionMode::Disabled);
    EXPECT_FALSE(orchestrator->request(TriggerKind::Manual));

    orchestrator->setMode(CompletionMode::ManualOnly);
    EXPECT_FALSE(orchestrator->request(TriggerKind::Auto));
    EXPECT_TRUE(orchestrator->request(TriggerKind::Manual));

    orchestrator->setMode(CompletionMode::Disabled);
    EXPECT_EQ(orchestrator->state(), OrchestratorState::Idle);
    EXPECT_EQ(modes, (QList<CompletionMode>{CompletionMode::Disabled, CompletionMode::ManualOnly,
                                            CompletionMode::Disabled}));
    // cancelled, so no sample
    EXPECT_TRUE(orchestrator->timeoutEstimator().history().isEmpty());
}

TEST_F(CompletionOrchestratorTest, StatusStreamFollowsTheCycle) {
    showSuggestion();
    orchestrator->reject();
    EXPECT_EQ(statuses, (QList<CompletionStatus>{CompletionStatus::Requesting, CompletionStatus::SuggestionReady,
                                                 CompletionStatus::Idle}));
}
