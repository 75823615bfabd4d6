#include "common/utilities_test.hpp"

#include <stdexcept>

namespace chatraw_tests {

namespace {

bool endsWith(const std::string& text, const std::string& suffix) {
  return text.size() >= suffix.size() &&
         text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

void FakeHttpTransport::script(const std::string& urlSuffix, ScriptedResponse response) {
  scripts_[urlSuffix].push_back(std::move(response));
}

ScriptedResponse FakeHttpTransport::next(const chatraw::HttpRequest& request) {
  requests_.push_back(request);
  for (auto& [suffix, queue] : scripts_) {
    if (!endsWith(request.url, suffix) || queue.empty()) {
      continue;
    }
    ScriptedResponse response = queue.front();
    if (queue.size() > 1) {
      queue.pop_front();
    }
    return response;
  }
  throw std::logic_error("No scripted response for " + request.url);
}

chatraw::HttpResponse FakeHttpTransport::post(const chatraw::HttpRequest& request) {
  return next(request).response;
}

chatraw::HttpResponse FakeHttpTransport::postStream(const chatraw::HttpRequest& request,
                                                    const chatraw::StreamDataCallback& onData) {
  ScriptedResponse scripted = next(request);
  if (!scripted.response.ok()) {
    return scripted.response;
  }
  for (const auto& chunk : scripted.streamChunks) {
    ++deliveredChunks_;
    if (!onData(chunk.data(), chunk.size())) {
      chatraw::HttpResponse cancelled;
      cancelled.status = chatraw::TransportStatus::Cancelled;
      cancelled.status_code = scripted.response.status_code;
      cancelled.error_message = "Callback aborted";
      return cancelled;
    }
  }
  return scripted.response;
}

size_t FakeHttpTransport::callsTo(const std::string& urlSuffix) const {
  size_t count = 0;
  for (const auto& request : requests_) {
    if (endsWith(request.url, urlSuffix)) {
      ++count;
    }
  }
  return count;
}

nlohmann::json FakeHttpTransport::lastBodyFor(const std::string& urlSuffix) const {
  for (auto it = requests_.rbegin(); it != requests_.rend(); ++it) {
    if (endsWith(it->url, urlSuffix)) {
      return nlohmann::json::parse(it->body);
    }
  }
  return nlohmann::json();
}

chatraw::ProviderConfig TestUtilities::provider(const std::string& model, const std::string& url) {
  chatraw::ProviderConfig config;
  config.apiUrl = url;
  config.apiKey = "test-key";
  config.modelId = model;
  return config;
}

ScriptedResponse TestUtilities::json(const nlohmann::json& body, long status) {
  ScriptedResponse scripted;
  scripted.response.status = chatraw::TransportStatus::Ok;
  scripted.response.status_code = status;
  scripted.response.body = body.dump();
  return scripted;
}

ScriptedResponse TestUtilities::httpError(long status, const std::string& body) {
  ScriptedResponse scripted;
  scripted.response.status = chatraw::TransportStatus::Ok;
  scripted.response.status_code = status;
  scripted.response.body = body;
  return scripted;
}

ScriptedResponse TestUtilities::timeout() {
  ScriptedResponse scripted;
  scripted.response.status = chatraw::TransportStatus::Timeout;
  scripted.response.error_message = "Request timeout";
  return scripted;
}

ScriptedResponse TestUtilities::transportError(const std::string& message) {
  ScriptedResponse scripted;
  scripted.response.status = chatraw::TransportStatus::TransportError;
  scripted.response.error_message = message;
  return scripted;
}

ScriptedResponse TestUtilities::stream(const std::vector<std::string>& chunks) {
  ScriptedResponse scripted;
  scripted.response.status = chatraw::TransportStatus::Ok;
  scripted.response.status_code = 200;
  scripted.streamChunks = chunks;
  return scripted;
}

nlohmann::json TestUtilities::embeddingBody(const std::vector<std::vector<float>>& vectors,
                                            const std::vector<int>& indices) {
  nlohmann::json data = nlohmann::json::array();
  for (size_t i = 0; i < vectors.size(); ++i) {
    const int index = indices.empty() ? static_cast<int>(i) : indices[i];
    data.push_back({{"object", "embedding"}, {"embedding", vectors[i]}, {"index", index}});
  }
  return {{"object", "list"}, {"data", data}, {"model", "test-embedding"}};
}

std::string TestUtilities::sseDelta(const std::string& content, const std::string& reasoning,
                                    const std::string& reasoningField) {
  nlohmann::json delta = nlohmann::json::object();
  if (!content.empty()) {
    delta["content"] = content;
  }
  if (!reasoning.empty()) {
    delta[reasoningField] = reasoning;
  }
  nlohmann::json chunk = {{"id", "chatcmpl-1"},
                          {"object", "chat.completion.chunk"},
                          {"choices", {{{"index", 0}, {"delta", delta}, {"finish_reason", nullptr}}}}};
  return "data: " + chunk.dump() + "\n\n";
}

std::string TestUtilities::sseDone() {
  return "data: [DONE]\n\n";
}

std::vector<float> TestUtilities::unitVector(size_t dimension, size_t axis) {
  std::vector<float> vector(dimension, 0.0f);
  vector[axis] = 1.0f;
  return vector;
}

} // namespace chatraw_tests
