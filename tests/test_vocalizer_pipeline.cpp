#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>
#include <thread>

#include "fake_backend.hpp"
#include "internal/text/text_utils.hpp"
#include "internal/vocalizer_pipeline.hpp"

using namespace niqqud;
using niqqud::test_support::FakeBackendState;
using niqqud::test_support::makeFakeGateway;

class VocalizerPipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        state_ = std::make_shared<FakeBackendState>();
        state_->max_length = 12;
        // vowel only, easy to read
        state_->niqqud_class = 2;  // SHVA
        state_->dagesh_class = 0;
        state_->sin_class = 0;
        pipeline_ = std::make_unique<VocalizerPipeline>(makeFakeGateway(state_), false);
    }

    std::string run(const std::string& text) {
        std::string output;
        auto err = pipeline_->run(text, CancellationToken(), output);
        EXPECT_TRUE(err.isOk()) << err.message;
        return output;
    }

    std::shared_ptr<FakeBackendState> state_;
    std::unique_ptr<VocalizerPipeline> pipeline_;
};

TEST_F(VocalizerPipelineTest, VocalizesSingleWord) {
    // every eligible letter gets a shva; final mem takes nothing
    EXPECT_EQ(run("שלום"), "שְלְוְם");
    EXPECT_EQ(state_->predict_calls.load(), 1);
}

TEST_F(VocalizerPipelineTest, IdentityModelReturnsLettersUnchanged) {
    state_->niqqud_class = 1;
    EXPECT_EQ(run("שלום"), "שלום");
}

TEST_F(VocalizerPipelineTest, EmptyTextProducesEmptyOutput) {
    EXPECT_EQ(run(""), "");
}

TEST_F(VocalizerPipelineTest, LongTextIsChunkedAndJoined) {
    state_->niqqud_class = 1;
    std::string text = "אבג דהו זחט יכל מנס עפצ קרש";
    EXPECT_EQ(run(text), text);
    EXPECT_GE(state_->predict_calls.load(), 3);
    for (const auto& input : state_->inputs) {
        EXPECT_EQ(input.size(), 12u);
    }
}

TEST_F(VocalizerPipelineTest, MidWordCutKeepsWordIntact) {
    state_->niqqud_class = 1;
    std::string word = "אבגדהוזחטיכלמנסעפצקרשת";
    EXPECT_EQ(run(word), word);
    EXPECT_EQ(state_->predict_calls.load(), 3);
}

TEST_F(VocalizerPipelineTest, CollapsesSpacesAndTrims) {
    state_->niqqud_class = 1;
    EXPECT_EQ(run("  א   ב  "), "א ב");
}

TEST_F(VocalizerPipelineTest, KeepsNewlines) {
    state_->niqqud_class = 1;
    EXPECT_EQ(run("א\nב"), "א\nב");
}

TEST_F(VocalizerPipelineTest, CancelledTokenStopsBeforeModel) {
    CancellationToken token;
    token.cancel();
    std::string output = "untouched";
    auto err = pipeline_->run("שלום", token, output);
    EXPECT_EQ(err.code, ErrorCode::CANCELLED);
    EXPECT_EQ(output, "untouched");
    EXPECT_EQ(state_->predict_calls.load(), 0);
}

TEST_F(VocalizerPipelineTest, CancelDuringFirstChunkSkipsRemainingChunks) {
    state_->delay_ms = 200;
    CancellationToken token;
    std::thread canceller([this, token]() mutable {
        while (state_->predict_calls.load() < 1) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        token.cancel();
    });

    std::string output = "untouched";
    auto err = pipeline_->run("אבג דהו זחט יכל מנס", token, output);
    canceller.join();

    EXPECT_EQ(err.code, ErrorCode::CANCELLED);
    EXPECT_EQ(state_->predict_calls.load(), 1);
    EXPECT_EQ(output, "untouched");
}

TEST_F(VocalizerPipelineTest, MalformedModelOutputFailsInsteadOfTruncating) {
    state_->output_rows = 2;
    std::string output;
    auto err = pipeline_->run("שלום", CancellationToken(), output);
    EXPECT_EQ(err.code, ErrorCode::PREDICTION_FAILED);
    EXPECT_TRUE(output.empty());
}

TEST_F(VocalizerPipelineTest, PredictionFailurePropagates) {
    state_->fail_predict = true;
    std::string output;
    auto err = pipeline_->run("שלום", CancellationToken(), output);
    EXPECT_EQ(err.code, ErrorCode::PREDICTION_FAILED);
    EXPECT_TRUE(output.empty());
}

TEST_F(VocalizerPipelineTest, FoldingChangesModelInputOnly) {
    auto folding_state = std::make_shared<FakeBackendState>();
    folding_state->niqqud_class = 1;
    VocalizerPipeline folding(makeFakeGateway(folding_state), true);

    std::string output;
    ASSERT_TRUE(folding.run("שלום", CancellationToken(), output).isOk());
    EXPECT_EQ(output, "שלום");
    ASSERT_EQ(folding_state->inputs.size(), 1u);
    // ם folded to מ (index 30)
    EXPECT_EQ(folding_state->inputs[0][3], 30);
}

TEST(CancellationTokenTest, CopiesShareTheFlag) {
    CancellationToken a;
    CancellationToken b = a;
    EXPECT_FALSE(b.isCancelled());
    a.cancel();
    EXPECT_TRUE(b.isCancelled());

    CancellationToken fresh;
    EXPECT_FALSE(fresh.isCancelled());
}
