#include <gtest/gtest.h>

#include "ingredients/classification_service.hpp"
#include "ingredients/completion_client.hpp"
#include "ingredients/error.hpp"

#include "support/mock_http_client.hpp"

using ingredients::ClassificationParseError;
using ingredients::ClassificationService;
using ingredients::ClientOptions;
using ingredients::CompletionClient;
using ingredients::EmptyChoicesError;
using ingredients::UpstreamTransportError;
namespace mock = ingredients::testing;

namespace {

class ClassificationServiceTest : public ::testing::Test {
protected:
  ClassificationServiceTest() : client_(make_options(), make_transport()), service_(client_) {}

  static ClientOptions make_options() {
    ClientOptions options;
    options.api_key = "sk-test";
    return options;
  }

  std::unique_ptr<mock::MockHttpClient> make_transport() {
    auto transport = std::make_unique<mock::MockHttpClient>();
    transport_ = transport.get();
    return transport;
  }

  mock::MockHttpClient* transport_ = nullptr;
  CompletionClient client_;
  ClassificationService service_;
};

}  // namespace

TEST_F(ClassificationServiceTest, ReturnsClassificationField) {
  transport_->enqueue_response(200, mock::completion_body(R"({"classification":"vegan"})"));
  EXPECT_EQ(service_.categorize("chickpeas"), "vegan");
}

TEST_F(ClassificationServiceTest, PassesFreeFormValuesThrough) {
  transport_->enqueue_response(200, mock::completion_body(R"({"classification":"pescatarian","confidence":0.4})"));
  EXPECT_EQ(service_.categorize("anchovy"), "pescatarian");
}

TEST_F(ClassificationServiceTest, RejectsContentThatIsNotJson) {
  transport_->enqueue_response(200, mock::completion_body("It is vegan."));
  try {
    service_.categorize("rice");
    FAIL() << "Expected ClassificationParseError";
  } catch (const ClassificationParseError& err) {
    EXPECT_EQ(err.content(), "It is vegan.");
  }
}

TEST_F(ClassificationServiceTest, RejectsContentWithoutClassification) {
  transport_->enqueue_response(200, mock::completion_body(R"({"category":"vegan"})"));
  EXPECT_THROW(service_.categorize("rice"), ClassificationParseError);
}

TEST_F(ClassificationServiceTest, RejectsNonStringClassification) {
  transport_->enqueue_response(200, mock::completion_body(R"({"classification":["vegan"]})"));
  EXPECT_THROW(service_.categorize("rice"), ClassificationParseError);
}

TEST_F(ClassificationServiceTest, RejectsJsonThatIsNotAnObject) {
  transport_->enqueue_response(200, mock::completion_body(R"("vegan")"));
  EXPECT_THROW(service_.categorize("rice"), ClassificationParseError);
}

TEST_F(ClassificationServiceTest, PropagatesCompletionErrors) {
  transport_->enqueue_response(200, R"({"choices":[]})");
  EXPECT_THROW(service_.categorize("rice"), EmptyChoicesError);

  transport_->enqueue_error("connection reset");
  EXPECT_THROW(service_.categorize("rice"), UpstreamTransportError);
}

TEST_F(ClassificationServiceTest, EachCallReachesTheProvider) {
  transport_->enqueue_response(200, mock::completion_body(R"({"classification":"vegetarian"})"));
  transport_->enqueue_response(200, mock::completion_body(R"({"classification":"vegetarian"})"));

  EXPECT_EQ(service_.categorize("paneer"), "vegetarian");
  EXPECT_EQ(service_.categorize("paneer"), "vegetarian");
  EXPECT_EQ(transport_->call_count(), 2u);
}
