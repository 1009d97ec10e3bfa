#include "utilities_test.hpp"

#include <cmath>
#include <functional>
#include <random>

#include "recall_core/util/uuid.hpp"

namespace recall_tests {

std::filesystem::path TestUtilities::create_temp_test_db() {
  auto temp_dir = std::filesystem::temp_directory_path() / "recall_tests";
  std::filesystem::create_directories(temp_dir);

  return temp_dir / ("test_" + recall_core::util::new_record_id() + ".db");
}

void TestUtilities::cleanup_temp_db(const std::filesystem::path &db_path) {
  // WAL mode leaves side files next to the database
  for (const char *suffix : {"", "-wal", "-shm"}) {
    std::filesystem::path file = db_path.string() + suffix;
    if (std::filesystem::exists(file)) {
      std::filesystem::remove(file);
    }
  }

  // Also cleanup the parent directory if it's empty
  auto parent_dir = db_path.parent_path();
  if (std::filesystem::exists(parent_dir) && std::filesystem::is_empty(parent_dir)) {
    std::filesystem::remove(parent_dir);
  }
}

std::vector<float> TestUtilities::create_test_vector(const std::string &seed_text, int dimension) {
  std::mt19937 gen(static_cast<std::mt19937::result_type>(std::hash<std::string>{}(seed_text)));
  std::uniform_real_distribution<float> dis(-1.0f, 1.0f);

  std::vector<float> vec(dimension);
  for (int i = 0; i < dimension; ++i) {
    vec[i] = dis(gen);
  }
  return vec;
}

std::vector<float> TestUtilities::axis_vector(int axis, float scale, int dimension) {
  std::vector<float> vec(dimension, 0.0f);
  vec[axis] = scale;
  return vec;
}

std::vector<float> TestUtilities::angled_vector(double degrees, int dimension) {
  const double radians = degrees * 3.14159265358979323846 / 180.0;
  std::vector<float> vec(dimension, 0.0f);
  vec[0] = static_cast<float>(std::cos(radians));
  vec[1] = static_cast<float>(std::sin(radians));
  return vec;
}

recall_core::ConversationTurn TestUtilities::create_test_turn(const std::string &owner,
                                                              const std::string &text,
                                                              std::vector<float> embedding) {
  recall_core::ConversationTurn turn;
  turn.owner = owner;
  turn.text = text;
  turn.embedding = embedding.empty() ? create_test_vector(text) : std::move(embedding);
  return turn;
}

recall_core::DocumentFragment TestUtilities::create_test_fragment(
    const std::string &owner,
    const std::string &source,
    recall_core::Visibility visibility,
    const std::string &text,
    std::vector<float> embedding,
    recall_core::Metadata metadata) {
  recall_core::DocumentFragment fragment;
  fragment.owner = owner;
  fragment.source = source;
  fragment.visibility = visibility;
  fragment.text = text;
  fragment.metadata = std::move(metadata);
  fragment.embedding = embedding.empty() ? create_test_vector(text) : std::move(embedding);
  return fragment;
}

}  // namespace recall_tests
