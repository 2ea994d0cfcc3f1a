#include <gtest/gtest.h>

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "fake_backend.hpp"
#include "nakdan_api.hpp"

using niqqud::test_support::FakeBackendState;
using niqqud::test_support::makeFakeGateway;

namespace {

class CollectingCallback : public Nakdan::NakdanCallback {
public:
    void OnResult(std::shared_ptr<Nakdan::NakdanResult> result) override {
        std::lock_guard<std::mutex> lock(mutex);
        results.push_back(result);
    }

    void OnError(std::shared_ptr<Nakdan::NakdanResult> result) override {
        std::lock_guard<std::mutex> lock(mutex);
        errors.push_back(result);
    }

    std::mutex mutex;
    std::vector<std::shared_ptr<Nakdan::NakdanResult>> results;
    std::vector<std::shared_ptr<Nakdan::NakdanResult>> errors;
};

}  // namespace

class NakdanEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        state_ = std::make_shared<FakeBackendState>();
        state_->max_length = 32;
        state_->niqqud_class = 2;
        state_->dagesh_class = 0;
        state_->sin_class = 0;

        config_ = Nakdan::NakdanConfig::Default().withDebounce(30);
        niqqud::NiqqudConfig internal;
        internal.debounce_ms = 30;
        engine_ = std::make_unique<Nakdan::NakdanEngine>(config_, makeFakeGateway(state_, internal));
    }

    std::shared_ptr<FakeBackendState> state_;
    Nakdan::NakdanConfig config_;
    std::unique_ptr<Nakdan::NakdanEngine> engine_;
};

TEST_F(NakdanEngineTest, CallVocalizesSynchronously) {
    auto result = engine_->Call("שָׁלוֹם");
    ASSERT_TRUE(result != nullptr);
    EXPECT_TRUE(result->IsSuccess());
    EXPECT_EQ(result->GetCode(), "OK");
    EXPECT_EQ(result->GetText(), "שְלְוְם");
    EXPECT_EQ(result->GetRequestId(), 0u);
    EXPECT_FALSE(result->IsEmpty());
    EXPECT_TRUE(engine_->IsModelLoaded());
    EXPECT_EQ(engine_->GetEngineName(), "Fake");
}

TEST_F(NakdanEngineTest, CallWithEmptyTextSkipsModel) {
    auto result = engine_->Call("");
    EXPECT_TRUE(result->IsSuccess());
    EXPECT_TRUE(result->IsEmpty());
    EXPECT_EQ(state_->predict_calls.load(), 0);

    // only marks: nothing left after stripping
    result = engine_->Call("\xD6\xB8\xD6\xB0");
    EXPECT_TRUE(result->IsSuccess());
    EXPECT_TRUE(result->IsEmpty());
}

TEST_F(NakdanEngineTest, CallReportsPredictionFailure) {
    state_->fail_predict = true;
    auto result = engine_->Call("שלום");
    EXPECT_FALSE(result->IsSuccess());
    EXPECT_EQ(result->GetCode(), "PREDICTION_FAILED");
    EXPECT_EQ(result->GetMessage(), "scripted failure");
}

TEST_F(NakdanEngineTest, GenerateDeliversThroughCallback) {
    auto callback = std::make_shared<CollectingCallback>();
    engine_->SetCallback(callback);

    engine_->Generate("ש");
    auto id = engine_->Generate("שלום");
    ASSERT_TRUE(engine_->WaitForIdle(5000));

    EXPECT_EQ(engine_->GetState(), Nakdan::GenerationState::COMPLETED);
    EXPECT_EQ(engine_->GetOutput(), "שְלְוְם");
    EXPECT_FALSE(engine_->HasError());
    EXPECT_EQ(engine_->GetErrorMessage(), "");

    std::lock_guard<std::mutex> lock(callback->mutex);
    ASSERT_EQ(callback->results.size(), 1u);
    EXPECT_EQ(callback->results[0]->GetRequestId(), id);
    EXPECT_EQ(callback->results[0]->GetText(), "שְלְוְם");
}

TEST_F(NakdanEngineTest, GenerateFailureReachesOnError) {
    auto callback = std::make_shared<CollectingCallback>();
    engine_->SetCallback(callback);
    state_->fail_predict = true;

    engine_->Generate("שלום");
    ASSERT_TRUE(engine_->WaitForIdle(5000));

    EXPECT_EQ(engine_->GetState(), Nakdan::GenerationState::FAILED);
    EXPECT_TRUE(engine_->HasError());
    EXPECT_EQ(engine_->GetErrorMessage(), "scripted failure");

    std::lock_guard<std::mutex> lock(callback->mutex);
    ASSERT_EQ(callback->errors.size(), 1u);
    EXPECT_FALSE(callback->errors[0]->IsSuccess());
    EXPECT_EQ(callback->errors[0]->GetCode(), "PREDICTION_FAILED");
}

TEST_F(NakdanEngineTest, CancelReturnsToIdle) {
    engine_->Generate("שלום");
    engine_->Cancel();
    EXPECT_EQ(engine_->GetState(), Nakdan::GenerationState::IDLE);
    EXPECT_FALSE(engine_->IsGenerating());
    EXPECT_TRUE(engine_->WaitForIdle(100));
}

TEST_F(NakdanEngineTest, CallbackCanBeCleared) {
    auto callback = std::make_shared<CollectingCallback>();
    engine_->SetCallback(callback);
    engine_->SetCallback(nullptr);

    engine_->Generate("שלום");
    ASSERT_TRUE(engine_->WaitForIdle(5000));

    std::lock_guard<std::mutex> lock(callback->mutex);
    EXPECT_TRUE(callback->results.empty());
}

TEST(NakdanEngineStaticTest, StripNiqqud) {
    EXPECT_EQ(Nakdan::NakdanEngine::StripNiqqud("בְּרֵאשִׁית"), "בראשית");
    auto once = Nakdan::NakdanEngine::StripNiqqud("שָׁלוֹם עוֹלָם");
    EXPECT_EQ(Nakdan::NakdanEngine::StripNiqqud(once), once);
}

TEST(NakdanEngineConfigTest, MissingModelFailsLazily) {
    auto config = Nakdan::NakdanConfig::Nakdimon("/nonexistent/nakdimon.onnx").withDebounce(10);
    Nakdan::NakdanEngine engine(config);

    EXPECT_FALSE(engine.IsModelLoaded());
    EXPECT_EQ(engine.GetEngineName(), "Nakdan (nakdimon)");
    EXPECT_EQ(engine.GetConfig().model_path, "/nonexistent/nakdimon.onnx");

    auto result = engine.Call("שלום");
    EXPECT_FALSE(result->IsSuccess());
    EXPECT_EQ(result->GetCode(), "PREDICTION_FAILED");
    EXPECT_FALSE(engine.LoadModel());

    engine.Generate("שלום");
    ASSERT_TRUE(engine.WaitForIdle(5000));
    EXPECT_EQ(engine.GetState(), Nakdan::GenerationState::FAILED);
    EXPECT_TRUE(engine.HasError());
}

TEST(NakdanEngineConfigTest, InvalidConfigIsReportedByCall) {
    auto config = Nakdan::NakdanConfig::Default().withMaxLength(1);
    Nakdan::NakdanEngine engine(config);

    auto result = engine.Call("שלום");
    EXPECT_FALSE(result->IsSuccess());
    EXPECT_EQ(result->GetCode(), "INVALID_CONFIG");
}
