// Copyright (c) 2025-2026 Juantgd. All Rights Reserved.

#include "document/document.h"

#include <gtest/gtest.h>

#include <limits>
#include <string>
#include <vector>

using namespace coedit;

namespace {

Operation insert_at(uint32_t line, uint32_t column, std::string text) {
  return Operation::Insert("ins", {.line = line, .column = column},
                           std::move(text), "tester", 1, 0);
}

Operation delete_at(uint32_t line, uint32_t column, uint32_t length) {
  return Operation::Delete("del", {.line = line, .column = column}, length,
                           "tester", 1, 0);
}

} // namespace

TEST(DocumentTest, DocumentEmptyTest) {
  Document doc("doc-1");
  ASSERT_EQ(doc.content().size(), 1u);
  ASSERT_EQ(doc.Text(), "");
  ASSERT_EQ(doc.version(), 0u);
  ASSERT_EQ(doc.title(), "Untitled Document");
  ASSERT_EQ(doc.language(), "javascript");
  ASSERT_GE(doc.last_modified(), doc.created_at());
}

TEST(DocumentTest, DocumentInsertTest) {
  Document doc("doc-1");
  ASSERT_TRUE(doc.Apply(insert_at(0, 0, "hello")));
  ASSERT_TRUE(doc.Apply(insert_at(0, 5, " world")));
  ASSERT_EQ(doc.Text(), "hello world");
  ASSERT_EQ(doc.version(), 2u);

  // 插入多行内容会拆分当前行
  ASSERT_TRUE(doc.Apply(insert_at(0, 5, ",\nbig\n")));
  ASSERT_EQ(doc.content(),
            (std::vector<std::string>{"hello,", "big", " world"}));
  ASSERT_EQ(doc.version(), 3u);

  // 列号超出行长时追加到行尾
  ASSERT_TRUE(doc.Apply(insert_at(1, 40, "!")));
  ASSERT_EQ(doc.content()[1], "big!");
}

TEST(DocumentTest, DocumentInsertExpandTest) {
  Document doc("doc-1");
  // 目标行不存在时补齐空行
  ASSERT_TRUE(doc.Apply(insert_at(3, 0, "tail")));
  ASSERT_EQ(doc.content(),
            (std::vector<std::string>{"", "", "", "tail"}));
  ASSERT_EQ(doc.version(), 1u);
}

TEST(DocumentTest, DocumentDeleteTest) {
  Document doc("doc-1");
  doc.SyncVersion(1, {"hello world", "second"});
  // 向前删除光标之前的字符
  ASSERT_TRUE(doc.Apply(delete_at(0, 6, 1)));
  ASSERT_EQ(doc.content()[0], "helloworld");
  ASSERT_EQ(doc.version(), 2u);

  ASSERT_TRUE(doc.Apply(delete_at(0, 5, 3)));
  ASSERT_EQ(doc.content()[0], "heworld");

  // 删除长度超过光标前的字符数时只删到行首
  ASSERT_TRUE(doc.Apply(delete_at(0, 2, 10)));
  ASSERT_EQ(doc.content()[0], "world");
  ASSERT_EQ(doc.version(), 4u);
}

TEST(DocumentTest, DocumentDeleteLineBreakTest) {
  Document doc("doc-1");
  doc.SyncVersion(1, {"first", "second", "third"});
  // 行首删除与上一行合并
  ASSERT_TRUE(doc.Apply(delete_at(1, 0, 1)));
  ASSERT_EQ(doc.content(), (std::vector<std::string>{"firstsecond", "third"}));

  // 第一行行首删除不修改内容，但版本照常推进
  uint64_t version = doc.version();
  ASSERT_TRUE(doc.Apply(delete_at(0, 0, 1)));
  ASSERT_EQ(doc.content(), (std::vector<std::string>{"firstsecond", "third"}));
  ASSERT_EQ(doc.version(), version + 1);

  // 越界删除视为空操作
  ASSERT_TRUE(doc.Apply(delete_at(9, 3, 1)));
  ASSERT_EQ(doc.content().size(), 2u);

  // 零长度删除不会合并行
  ASSERT_TRUE(doc.Apply(delete_at(1, 0, 0)));
  ASSERT_EQ(doc.content().size(), 2u);
}

TEST(DocumentTest, DocumentPassiveOperationTest) {
  Document doc("doc-1");
  doc.SyncVersion(1, {"abc"});
  Operation cursor = insert_at(0, 1, "ignored");
  cursor.type = OpType::CURSOR;
  ASSERT_TRUE(doc.Apply(cursor));
  cursor.type = OpType::RETAIN;
  ASSERT_TRUE(doc.Apply(cursor));
  ASSERT_EQ(doc.Text(), "abc");
  ASSERT_EQ(doc.version(), 3u);

  // 未知类型被拒绝，版本不变
  cursor.type = OpType::UNKNOWN;
  ASSERT_FALSE(doc.Apply(cursor));
  ASSERT_EQ(doc.version(), 3u);
}

TEST(DocumentTest, DocumentVersionSyncTest) {
  Document doc("doc-1");
  for (int i = 0; i < 3; ++i) {
    doc.Apply(insert_at(0, 0, "x"));
  }
  ASSERT_EQ(doc.version(), 3u);
  ASSERT_TRUE(doc.SyncVersion(5, {"a", "b"}));
  ASSERT_EQ(doc.version(), 5u);
  ASSERT_EQ(doc.content(), (std::vector<std::string>{"a", "b"}));

  for (int i = 0; i < 2; ++i) {
    doc.Apply(insert_at(0, 0, "y"));
  }
  ASSERT_EQ(doc.version(), 7u);
  ASSERT_FALSE(doc.SyncVersion(5, {"stale"}));
  ASSERT_FALSE(doc.SyncVersion(7, {"same"}));
  ASSERT_EQ(doc.content(), (std::vector<std::string>{"yya", "b"}));
  ASSERT_EQ(doc.version(), 7u);

  // 空内容规整为一个空行
  ASSERT_TRUE(doc.SyncVersion(8, {}));
  ASSERT_EQ(doc.content().size(), 1u);
  ASSERT_EQ(doc.Text(), "");
}

TEST(DocumentTest, DocumentApplyLimitTest) {
  Document doc("doc-1");
  ASSERT_TRUE(doc.Apply(insert_at(0, 0, "a")));
  // 行号过大的插入被拒绝，不会补齐海量空行
  ASSERT_FALSE(doc.Apply(insert_at(4294967295u, 0, "evil")));
  ASSERT_FALSE(doc.Apply(insert_at(1u << 20, 0, "evil")));
  ASSERT_EQ(doc.content().size(), 1u);
  ASSERT_EQ(doc.version(), 1u);

  // 版本号达到上限后不再回绕
  const uint64_t max_version = std::numeric_limits<uint64_t>::max();
  ASSERT_TRUE(doc.SyncVersion(max_version, {"top"}));
  ASSERT_FALSE(doc.Apply(insert_at(0, 0, "x")));
  ASSERT_FALSE(doc.Apply(delete_at(0, 1, 1)));
  ASSERT_EQ(doc.version(), max_version);
  ASSERT_EQ(doc.Text(), "top");
}

TEST(DocumentTest, DocumentSnapshotTest) {
  Document doc("doc-1", "notes", "cpp");
  doc.AddCollaborator("alice");
  ASSERT_FALSE(doc.AddCollaborator("alice"));
  doc.AddCollaborator("bob");
  doc.Apply(insert_at(0, 0, "int main() {}"));
  DocumentSnapshot snapshot = doc.Snapshot();
  nlohmann::json j = snapshot;
  ASSERT_EQ(j["id"].get<std::string>(), "doc-1");
  ASSERT_EQ(j["title"].get<std::string>(), "notes");
  ASSERT_EQ(j["language"].get<std::string>(), "cpp");
  ASSERT_EQ(j["version"].get<uint64_t>(), 1u);
  ASSERT_EQ(j["content"][0].get<std::string>(), "int main() {}");
  ASSERT_EQ(j["collaborators"].size(), 2u);
  ASSERT_TRUE(doc.RemoveCollaborator("bob"));
  ASSERT_FALSE(doc.RemoveCollaborator("bob"));
}
