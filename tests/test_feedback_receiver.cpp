/**
 * @file test_feedback_receiver.cpp
 * @brief Unit tests for FeedbackReceiver, LatestValueMailbox and MIDI parsing
 *
 * Validates:
 * - Feedback channel / CC resolution against the mapping table
 * - Dropping of malformed and unmapped messages
 * - Burst coalescing to the latest value
 * - Threaded delivery through the port callback
 */

#include <gtest/gtest.h>
#include <handdeck/midi/FeedbackReceiver.hpp>
#include <handdeck/control/ValueMapping.hpp>
#include <handdeck/core/Logger.hpp>

#include "support/MockMidiPort.hpp"

#include <chrono>
#include <thread>

using namespace handdeck;
using namespace handdeck::midi;
using control::ControlId;
using control::DeckId;
using handdeck_test::MockMidiPort;

class FeedbackReceiverTest : public ::testing::Test {
protected:
    void SetUp() override {
        core::Logger::getInstance().setLevel(core::LogLevel::WARNING);
        port_ = std::make_shared<MockMidiPort>();
        ASSERT_TRUE(port_->open());
        decks_[0] = std::make_shared<control::DeckController>(DeckId::DECK_1);
        decks_[1] = std::make_shared<control::DeckController>(DeckId::DECK_2);
        receiver_ = std::make_unique<FeedbackReceiver>(port_, MidiMapping::defaults(), decks_);
    }

    void TearDown() override {
        receiver_->stop();
    }

    float valueOf(DeckId deck, ControlId id) const {
        return decks_[control::index_of(deck)]->snapshot().control(id).smoothed_value;
    }

    std::shared_ptr<MockMidiPort> port_;
    FeedbackReceiver::DeckArray decks_;
    std::unique_ptr<FeedbackReceiver> receiver_;
};

/**
 * Test 1: Wire parsing accepts only 3-byte Control Change messages
 */
TEST(MidiMessageTest, ParseControlChange) {
    auto msg = MidiMessage::fromBytes({0xB2, 37, 10});
    ASSERT_TRUE(msg.has_value());
    EXPECT_EQ(msg->channel, 2);
    EXPECT_EQ(msg->ccNumber, 37);
    EXPECT_EQ(msg->value, 10);
    EXPECT_EQ(msg->direction, MidiMessage::Direction::INBOUND);

    EXPECT_FALSE(MidiMessage::fromBytes({0x91, 60, 100}).has_value());    // note on
    EXPECT_FALSE(MidiMessage::fromBytes({0xB1, 2}).has_value());
    EXPECT_FALSE(MidiMessage::fromBytes({0xB1, 2, 0x80}).has_value());
    EXPECT_FALSE(MidiMessage::fromBytes({}).has_value());

    MidiMessage out;
    out.channel = 0;
    out.ccNumber = 33;
    out.value = 64;
    EXPECT_EQ(out.toBytes(), (std::vector<unsigned char>{0xB0, 33, 64}));
}

/**
 * Test 2: Default mapping resolves feedback channels per deck
 */
TEST(MidiMappingTest, DefaultFeedbackResolution) {
    MidiMapping mapping = MidiMapping::defaults();
    EXPECT_TRUE(mapping.isValid());

    auto lowEq = mapping.resolveFeedback(1, 2);
    ASSERT_TRUE(lowEq.has_value());
    EXPECT_EQ(lowEq->first, DeckId::DECK_1);
    EXPECT_EQ(lowEq->second, ControlId::LOW_EQ);

    auto volume = mapping.resolveFeedback(2, 37);
    ASSERT_TRUE(volume.has_value());
    EXPECT_EQ(volume->first, DeckId::DECK_2);
    EXPECT_EQ(volume->second, ControlId::VOLUME);

    // Outbound channel is not a feedback channel
    EXPECT_FALSE(mapping.resolveFeedback(0, 2).has_value());
    // Deck 2 CC on Deck 1's feedback channel
    EXPECT_FALSE(mapping.resolveFeedback(1, 37).has_value());
}

/**
 * Test 3: Duplicate CCs within a deck invalidate the mapping
 */
TEST(MidiMappingTest, DuplicateCcIsInvalid) {
    MidiMapping mapping = MidiMapping::defaults();
    mapping.decks[0].cc[control::index_of(ControlId::MID_EQ)] = 1;
    EXPECT_FALSE(mapping.isValid());

    mapping = MidiMapping::defaults();
    mapping.decks[1].outChannel = 16;
    EXPECT_FALSE(mapping.isValid());
}

/**
 * Test 4: Host values update the matching control
 */
TEST_F(FeedbackReceiverTest, AppliesResolvedValues) {
    receiver_->handleRawMessage({0xB1, 2, 100});
    receiver_->handleRawMessage({0xB2, 37, 10});
    EXPECT_EQ(receiver_->processPending(), 2u);

    EXPECT_FLOAT_EQ(valueOf(DeckId::DECK_1, ControlId::LOW_EQ),
                    control::dequantize(ControlId::LOW_EQ, 100));
    EXPECT_FLOAT_EQ(valueOf(DeckId::DECK_2, ControlId::VOLUME),
                    control::dequantize(ControlId::VOLUME, 10));

    // Other controls untouched
    EXPECT_FLOAT_EQ(valueOf(DeckId::DECK_1, ControlId::VOLUME), 1.0f);
    EXPECT_FLOAT_EQ(valueOf(DeckId::DECK_2, ControlId::LOW_EQ), 1.0f);

    auto snapshot = decks_[0]->snapshot();
    EXPECT_TRUE(snapshot.control(ControlId::LOW_EQ).has_external_baseline);
    EXPECT_EQ(snapshot.control(ControlId::LOW_EQ).last_sent_midi, 100);
}

/**
 * Test 5: Unmapped and malformed messages are dropped
 */
TEST_F(FeedbackReceiverTest, DropsUnresolvedMessages) {
    receiver_->handleRawMessage({0xB0, 2, 100});     // outbound channel
    receiver_->handleRawMessage({0xB1, 99, 100});    // unmapped CC
    receiver_->handleRawMessage({0x91, 2, 100});     // note on
    receiver_->handleRawMessage({0xB1, 2});          // truncated

    EXPECT_EQ(receiver_->processPending(), 0u);
    auto stats = receiver_->getStatistics();
    EXPECT_EQ(stats.messagesReceived, 4u);
    EXPECT_EQ(stats.messagesDropped, 4u);
    EXPECT_EQ(stats.valuesApplied, 0u);
    EXPECT_FLOAT_EQ(valueOf(DeckId::DECK_1, ControlId::LOW_EQ), 1.0f);
}

/**
 * Test 6: A burst for one control collapses to its latest value
 */
TEST_F(FeedbackReceiverTest, BurstCoalescesToLatest) {
    for (int i = 0; i < 50; ++i) {
        receiver_->handleRawMessage({0xB1, 1, static_cast<unsigned char>(i)});
    }

    EXPECT_EQ(receiver_->processPending(), 1u);
    EXPECT_FLOAT_EQ(valueOf(DeckId::DECK_1, ControlId::FILTER),
                    control::dequantize(ControlId::FILTER, 49));

    auto stats = receiver_->getStatistics();
    EXPECT_EQ(stats.messagesReceived, 50u);
    EXPECT_EQ(stats.valuesApplied, 1u);
    EXPECT_EQ(stats.valuesCoalesced, 49u);

    EXPECT_EQ(receiver_->processPending(), 0u);
}

/**
 * Test 7: Toggle feedback updates the stored value without side effects
 */
TEST_F(FeedbackReceiverTest, ToggleFeedbackIsRecorded) {
    receiver_->handleRawMessage({0xB2, 0x32, 127});
    EXPECT_EQ(receiver_->processPending(), 1u);
    EXPECT_FLOAT_EQ(valueOf(DeckId::DECK_2, ControlId::PLAY), 1.0f);
    EXPECT_TRUE(decks_[1]->collect_updates().updates.empty());
}

/**
 * Test 8: Threaded delivery through the port callback
 */
TEST_F(FeedbackReceiverTest, ThreadedDelivery) {
    EXPECT_FALSE(port_->hasCallback());
    ASSERT_TRUE(receiver_->start());
    EXPECT_TRUE(receiver_->isRunning());
    EXPECT_TRUE(port_->hasCallback());

    ASSERT_TRUE(port_->inject({0xB1, 5, 20}));

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(500);
    while (receiver_->getStatistics().valuesApplied == 0 &&
           std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    EXPECT_EQ(receiver_->getStatistics().valuesApplied, 1u);
    EXPECT_FLOAT_EQ(valueOf(DeckId::DECK_1, ControlId::VOLUME),
                    control::dequantize(ControlId::VOLUME, 20));

    receiver_->stop();
    EXPECT_FALSE(receiver_->isRunning());
    EXPECT_FALSE(port_->hasCallback());
    EXPECT_FALSE(port_->inject({0xB1, 5, 30}));

    // Idempotent
    receiver_->stop();
}

/**
 * Test 9: Mailbox wait is released by close()
 */
TEST(LatestValueMailboxTest, CloseReleasesWaiter) {
    LatestValueMailbox mailbox;
    EXPECT_FALSE(mailbox.waitForData(std::chrono::milliseconds(10)));

    std::thread waiter([&mailbox]() {
        mailbox.waitForData(std::chrono::milliseconds(5000));
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    auto start = std::chrono::steady_clock::now();
    mailbox.close();
    waiter.join();
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(1000));

    mailbox.reopen();
    mailbox.store(DeckId::DECK_2, ControlId::HIGH_EQ, 70);
    EXPECT_TRUE(mailbox.waitForData(std::chrono::milliseconds(10)));
    auto entries = mailbox.drain();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].deck, DeckId::DECK_2);
    EXPECT_EQ(entries[0].control, ControlId::HIGH_EQ);
    EXPECT_EQ(entries[0].value, 70);
}
