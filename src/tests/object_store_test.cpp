#include <gtest/gtest.h>
#include "core/gist_error.hpp"
#include "store/file_object_store.hpp"
#include "store/memory_object_store.hpp"
#include "test_utils.hpp"
#include <atomic>
#include <thread>

using namespace gistvault::store;

namespace {

Bytes bytes_of(const std::string& text) {
  return Bytes(text.begin(), text.end());
}

} // namespace

// Contract shared by every ObjectStore implementation
class ObjectStoreContractTest : public ::testing::TestWithParam<std::string> {
protected:
  std::filesystem::path test_dir;
  std::unique_ptr<ObjectStore> objects;

  void SetUp() override {
    if (GetParam() == "file") {
      test_dir = make_test_dir("object_store_test");
      objects = std::make_unique<FileObjectStore>(test_dir.string());
    } else {
      objects = std::make_unique<MemoryObjectStore>();
    }
    ASSERT_NE(objects, nullptr);
  }

  void TearDown() override {
    objects.reset();
    if (!test_dir.empty() && std::filesystem::exists(test_dir)) {
      std::filesystem::remove_all(test_dir);
    }
  }

  void put_and_verify(const std::string& key, const Bytes& data) {
    ASSERT_NO_THROW(objects->put(key, data)) << "Failed to store key: " << key;
    auto stored = objects->get(key);
    ASSERT_TRUE(stored.has_value()) << "Key should exist after storing: " << key;
    EXPECT_EQ(*stored, data) << "Data mismatch for key: " << key;
  }
};

TEST_P(ObjectStoreContractTest, PutThenGet) {
  put_and_verify("metadata/abc.json", bytes_of("{\"id\":\"abc\"}"));
  put_and_verify("blobs/abc/0001", make_blob(4096));
  put_and_verify("empty", Bytes{});
}

TEST_P(ObjectStoreContractTest, GetMissingKeyIsEmpty) {
  EXPECT_FALSE(objects->get("nonexistent").has_value());
}

TEST_P(ObjectStoreContractTest, PutReplacesExistingValue) {
  put_and_verify("key", bytes_of("first version, longer"));
  put_and_verify("key", bytes_of("second"));
}

TEST_P(ObjectStoreContractTest, RemoveIsIdempotent) {
  put_and_verify("key", bytes_of("value"));
  EXPECT_NO_THROW(objects->remove("key"));
  EXPECT_FALSE(objects->get("key").has_value());
  EXPECT_NO_THROW(objects->remove("key"));
  EXPECT_NO_THROW(objects->remove("never-stored"));
}

TEST_P(ObjectStoreContractTest, ListFiltersByPrefixAndSorts) {
  objects->put("blobs/abc/0002", bytes_of("2"));
  objects->put("blobs/abc/0001", bytes_of("1"));
  objects->put("blobs/abd/0001", bytes_of("x"));
  objects->put("metadata/abc.json", bytes_of("{}"));

  std::vector<std::string> expected = {"blobs/abc/0001", "blobs/abc/0002"};
  EXPECT_EQ(objects->list("blobs/abc/"), expected);
  EXPECT_EQ(objects->list("blobs/").size(), 3u);
  EXPECT_EQ(objects->list("").size(), 4u);
  EXPECT_TRUE(objects->list("versions/").empty());

  objects->remove("blobs/abc/0001");
  EXPECT_EQ(objects->list("blobs/abc/"), std::vector<std::string>{"blobs/abc/0002"});
}

TEST_P(ObjectStoreContractTest, KeysWithPathCharactersStayOpaque) {
  const std::vector<std::string> keys = {
    "../path/traversal",
    std::string(1024, 'a'),
    "/absolute/path",
    "\\windows\\path"
  };
  for (const auto& key : keys) {
    put_and_verify(key, bytes_of(key));
  }
  EXPECT_EQ(objects->list("").size(), keys.size());
}

TEST_P(ObjectStoreContractTest, ConcurrentWritersToDistinctKeys) {
  const int thread_count = 8;
  std::atomic<int> failures{0};
  std::vector<std::thread> threads;

  for (int t = 0; t < thread_count; ++t) {
    threads.emplace_back([this, t, &failures]() {
      try {
        for (int i = 0; i < 10; ++i) {
          const std::string key = "blobs/t" + std::to_string(t) + "/" + std::to_string(i);
          objects->put(key, make_blob(128, static_cast<uint8_t>(t)));
        }
      } catch (const gistvault::core::StorageError&) {
        ++failures;
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(failures.load(), 0);
  EXPECT_EQ(objects->list("blobs/").size(), static_cast<size_t>(thread_count * 10));
}

INSTANTIATE_TEST_SUITE_P(Implementations, ObjectStoreContractTest,
                         ::testing::Values("file", "memory"));


// ---- FILE OBJECT STORE SPECIFICS ----

class FileObjectStoreTest : public ::testing::Test {
protected:
  std::filesystem::path test_dir;
  std::unique_ptr<FileObjectStore> objects;

  void SetUp() override {
    test_dir = make_test_dir("file_object_store_test");
    objects = std::make_unique<FileObjectStore>(test_dir.string());
  }

  void TearDown() override {
    if (objects) {
      objects->clear();
      objects.reset();
    }
    if (std::filesystem::exists(test_dir)) {
      std::filesystem::remove_all(test_dir);
    }
  }

  size_t count_files() const {
    size_t count = 0;
    for (const auto& entry : std::filesystem::recursive_directory_iterator(test_dir)) {
      if (entry.is_regular_file()) {
        ++count;
      }
    }
    return count;
  }
};

TEST_F(FileObjectStoreTest, PersistsAcrossInstances) {
  objects->put("metadata/abc.json", bytes_of("{}"), {{"gist_id", "abc"}});
  objects.reset();

  objects = std::make_unique<FileObjectStore>(test_dir.string());
  auto stored = objects->get("metadata/abc.json");
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(*stored, bytes_of("{}"));
  EXPECT_EQ(objects->list("metadata/"), std::vector<std::string>{"metadata/abc.json"});
}

TEST_F(FileObjectStoreTest, KeepsCustomMetadata) {
  objects->put("blobs/abc/1", bytes_of("x"), {{"gist_id", "abc"}, {"dotted.name", "v"}});
  CustomMetadata metadata = objects->get_metadata("blobs/abc/1");
  EXPECT_EQ(metadata.at("gist_id"), "abc");
  EXPECT_EQ(metadata.at("dotted.name"), "v");
  EXPECT_TRUE(objects->get_metadata("missing").empty());
}

TEST_F(FileObjectStoreTest, LeavesNoTemporaryFiles) {
  objects->put("key", make_blob(10000));
  objects->put("key", make_blob(20));
  // Object plus its sidecar
  EXPECT_EQ(count_files(), 2u);
}

TEST_F(FileObjectStoreTest, RemovePrunesEmptyDirectories) {
  objects->put("key", bytes_of("value"));
  EXPECT_TRUE(objects->has("key"));
  objects->remove("key");
  EXPECT_FALSE(objects->has("key"));
  EXPECT_TRUE(std::filesystem::is_empty(test_dir));
}

TEST_F(FileObjectStoreTest, ClearRemovesEverything) {
  objects->put("a", bytes_of("1"));
  objects->put("b", bytes_of("2"));
  objects->clear();
  EXPECT_TRUE(objects->list("").empty());
  EXPECT_TRUE(std::filesystem::exists(test_dir));
}


// ---- MEMORY OBJECT STORE SPECIFICS ----

TEST(MemoryObjectStoreTest, TracksSizeAndMetadata) {
  MemoryObjectStore objects;
  objects.put("a", bytes_of("1"), {{"gist_id", "a"}});
  objects.put("b", bytes_of("2"));
  EXPECT_EQ(objects.size(), 2u);
  EXPECT_EQ(objects.get_metadata("a").at("gist_id"), "a");
  objects.remove("a");
  EXPECT_EQ(objects.size(), 1u);
}
