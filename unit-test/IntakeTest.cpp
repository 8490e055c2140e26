#include "gtest/gtest.h"
#include "common/exceptions.hpp"
#include "judge/check.hpp"
#include "judge/intake.hpp"
#include "test/worker.hpp"

using namespace std;
using namespace std::filesystem;
using namespace grader;

class IntakeTest : public ::testing::Test {
protected:
    static void SetUpTestCase() {
        setup_test_environment();
    }

    void SetUp() override {
        dir = make_temp_dir("intake");
        checks = make_shared<const check_set>(make_check_set({"q1", "q2"}));
    }

    void TearDown() override {
        remove_all(dir);
    }

    path dir;
    shared_ptr<const check_set> checks;
};

TEST_F(IntakeTest, IdentifierIsFileStemInReferenceOrder) {
    write_file(dir / "bob.py", "print(1)");
    write_file(dir / "alice.py", "print(2)");

    auto jobs = normalize_submissions({dir / "bob.py", dir / "alice.py"}, checks);
    ASSERT_EQ(jobs.size(), 2);
    EXPECT_EQ(jobs[0].id, "bob");
    EXPECT_EQ(jobs[1].id, "alice");
    EXPECT_EQ(jobs[0].status, job_status::PENDING);
    EXPECT_EQ(jobs[0].attempts, 0);
    EXPECT_EQ(jobs[0].checks, checks);
    EXPECT_TRUE(jobs[0].path.is_absolute());
}

TEST_F(IntakeTest, MissingSubmissionIsRejected) {
    write_file(dir / "bob.py", "print(1)");
    try {
        normalize_submissions({dir / "bob.py", dir / "missing.py"}, checks);
        FAIL() << "intake_error expected";
    } catch (intake_error &ex) {
        EXPECT_EQ(ex.reference, (dir / "missing.py").string());
    }
}

TEST_F(IntakeTest, DirectoryIsNotASubmission) {
    create_directories(dir / "folder.py");
    EXPECT_THROW(normalize_submissions({dir / "folder.py"}, checks), intake_error);
}

TEST_F(IntakeTest, DuplicateReferenceIsRejected) {
    write_file(dir / "bob.py", "print(1)");
    EXPECT_THROW(normalize_submissions({dir / "bob.py", dir / "." / "bob.py"}, checks), duplicate_submission);
}

TEST_F(IntakeTest, IdentifierCollisionIsRejected) {
    write_file(dir / "bob.py", "print(1)");
    write_file(dir / "late" / "bob.py", "print(2)");
    EXPECT_THROW(normalize_submissions({dir / "bob.py", dir / "late" / "bob.py"}, checks), duplicate_submission);
}

TEST_F(IntakeTest, LenientModeSkipsInvalidReferences) {
    write_file(dir / "bob.py", "print(1)");
    write_file(dir / "late" / "bob.py", "print(2)");
    write_file(dir / "carol.py", "print(3)");

    vector<intake_rejection> rejected;
    auto jobs = normalize_submissions({dir / "bob.py", dir / "missing.py", dir / "late" / "bob.py", dir / "carol.py"},
                                      checks, {}, &rejected);
    ASSERT_EQ(jobs.size(), 2);
    EXPECT_EQ(jobs[0].id, "bob");
    EXPECT_EQ(jobs[1].id, "carol");
    ASSERT_EQ(rejected.size(), 2);
    EXPECT_EQ(rejected[0].reference, (dir / "missing.py").string());
    EXPECT_EQ(rejected[1].reference, (dir / "late" / "bob.py").string());
}

TEST_F(IntakeTest, ListSubmissionsFiltersAndSorts) {
    write_file(dir / "b.py", "");
    write_file(dir / "a.py", "");
    write_file(dir / "notes.txt", "");
    write_file(dir / ".hidden.py", "");
    create_directories(dir / "sub.py");

    auto files = list_submissions(dir, {".py"});
    ASSERT_EQ(files.size(), 2);
    EXPECT_EQ(files[0].filename(), "a.py");
    EXPECT_EQ(files[1].filename(), "b.py");

    EXPECT_EQ(list_submissions(dir, {}).size(), 3);
    EXPECT_THROW(list_submissions(dir / "missing", {".py"}), intake_error);
}

TEST_F(IntakeTest, MetadataAssignsIdentifiers) {
    write_file(dir / "sub1.py", "");
    write_file(dir / "sub2.py", "");
    write_file(dir / "meta.json", R"([
        {"identifier": "alice@example.com", "filename": "sub1.py"},
        {"identifier": "bob@example.com", "filename": "sub2.py"}
    ])");

    auto metadata = load_metadata(dir / "meta.json");
    auto jobs = normalize_submissions({dir / "sub1.py", dir / "sub2.py"}, checks, metadata);
    ASSERT_EQ(jobs.size(), 2);
    EXPECT_EQ(jobs[0].id, "alice@example.com");
    EXPECT_EQ(jobs[1].id, "bob@example.com");
}

TEST_F(IntakeTest, UnregisteredSubmissionIsRejected) {
    write_file(dir / "sub1.py", "");
    write_file(dir / "sub3.py", "");
    map<string, string> metadata = {{"sub1.py", "alice"}};
    EXPECT_THROW(normalize_submissions({dir / "sub1.py", dir / "sub3.py"}, checks, metadata), intake_error);
}

TEST_F(IntakeTest, MalformedMetadata) {
    write_file(dir / "broken.json", "[{\"identifier\": ");
    EXPECT_THROW(load_metadata(dir / "broken.json"), intake_error);

    write_file(dir / "object.json", R"({"identifier": "a", "filename": "a.py"})");
    EXPECT_THROW(load_metadata(dir / "object.json"), intake_error);

    write_file(dir / "duplicate.json", R"([
        {"identifier": "alice", "filename": "sub1.py"},
        {"identifier": "alice", "filename": "sub2.py"}
    ])");
    EXPECT_THROW(load_metadata(dir / "duplicate.json"), duplicate_submission);

    EXPECT_THROW(load_metadata(dir / "missing.json"), intake_error);
}

TEST_F(IntakeTest, YamlMetadata) {
    write_file(dir / "sub1.ipynb", "{}");
    write_file(dir / "sub2.ipynb", "{}");
    write_file(dir / "meta.yml",
               "- identifier: alice@example.com\n"
               "  filename: sub1.ipynb\n"
               "- identifier: bob@example.com\n"
               "  filename: sub2.ipynb\n");

    auto metadata = load_yaml_metadata(dir / "meta.yml");
    ASSERT_EQ(metadata.size(), 2);
    auto jobs = normalize_submissions({dir / "sub2.ipynb", dir / "sub1.ipynb"}, checks, metadata);
    ASSERT_EQ(jobs.size(), 2);
    EXPECT_EQ(jobs[0].id, "bob@example.com");
    EXPECT_EQ(jobs[1].id, "alice@example.com");
}

TEST_F(IntakeTest, MalformedYamlMetadata) {
    write_file(dir / "broken.yml", "- identifier: [alice\n");
    EXPECT_THROW(load_yaml_metadata(dir / "broken.yml"), intake_error);

    write_file(dir / "mapping.yml", "identifier: alice\nfilename: sub1.ipynb\n");
    EXPECT_THROW(load_yaml_metadata(dir / "mapping.yml"), intake_error);

    write_file(dir / "incomplete.yml", "- identifier: alice\n");
    EXPECT_THROW(load_yaml_metadata(dir / "incomplete.yml"), intake_error);

    write_file(dir / "duplicate.yml",
               "- identifier: alice\n"
               "  filename: sub1.ipynb\n"
               "- identifier: bob\n"
               "  filename: sub1.ipynb\n");
    EXPECT_THROW(load_yaml_metadata(dir / "duplicate.yml"), duplicate_submission);

    EXPECT_THROW(load_yaml_metadata(dir / "missing.yml"), intake_error);
}

TEST_F(IntakeTest, DotsInsideFileName) {
    write_file(dir / "john..doe.py", "");
    auto jobs = normalize_submissions({dir / "john..doe.py"}, checks);
    ASSERT_EQ(jobs.size(), 1);
    EXPECT_EQ(jobs[0].id, "john..doe");
}

class CheckSetTest : public IntakeTest {};

TEST_F(CheckSetTest, ChecksFromDirectoryListing) {
    write_file(dir / "q2.py", "");
    write_file(dir / "q1.py", "");
    write_file(dir / ".q0.py", "");

    check_set loaded = check_set::load(dir);
    ASSERT_EQ(loaded.checks.size(), 2);
    EXPECT_EQ(loaded.checks[0].name, "q1");
    EXPECT_EQ(loaded.checks[1].name, "q2");
    EXPECT_DOUBLE_EQ(loaded.total_points(), 2);
    EXPECT_EQ(loaded.index_of("q2"), 1);
    EXPECT_EQ(loaded.index_of("q3"), -1);
    EXPECT_EQ(loaded.dir, absolute(dir));
}

TEST_F(CheckSetTest, ChecksFromManifest) {
    write_file(dir / "checks.json", R"([
        {"name": "style", "points": 0.5},
        {"name": "correctness", "points": 2, "hidden": true}
    ])");

    check_set loaded = check_set::load(dir);
    ASSERT_EQ(loaded.checks.size(), 2);
    EXPECT_EQ(loaded.checks[0].name, "style");
    EXPECT_DOUBLE_EQ(loaded.checks[0].points, 0.5);
    EXPECT_FALSE(loaded.checks[0].hidden);
    EXPECT_EQ(loaded.checks[1].name, "correctness");
    EXPECT_TRUE(loaded.checks[1].hidden);
    EXPECT_DOUBLE_EQ(loaded.total_points(), 2.5);
}

TEST_F(CheckSetTest, InvalidManifests) {
    write_file(dir / "checks.json", R"([{"name": "q1"}, {"name": "q1"}])");
    EXPECT_THROW(check_set::load(dir), intake_error);

    write_file(dir / "checks.json", R"([{"points": 1}])");
    EXPECT_THROW(check_set::load(dir), intake_error);

    write_file(dir / "checks.json", R"([{"name": "q1", "points": -1}])");
    EXPECT_THROW(check_set::load(dir), intake_error);

    write_file(dir / "checks.json", R"([{"name": "q1", "hidden": "yes"}])");
    EXPECT_THROW(check_set::load(dir), intake_error);

    write_file(dir / "checks.json", R"([])");
    EXPECT_THROW(check_set::load(dir), intake_error);

    EXPECT_THROW(check_set::load(dir / "missing"), intake_error);
}

TEST_F(CheckSetTest, AlignResultsFollowsDefinitionOrder) {
    check_set set = make_check_set({"q1", "q2", "q3"});
    check_result q3;
    q3.name = "q3";
    q3.score = 5;  // 超过满分
    q3.status = check_status::PASSED;
    check_result unknown;
    unknown.name = "q9";
    unknown.score = 1;
    unknown.status = check_status::PASSED;

    auto results = align_results(set, {q3, unknown});
    ASSERT_EQ(results.size(), 3);
    EXPECT_EQ(results[0].name, "q1");
    EXPECT_EQ(results[0].status, check_status::NOT_RUN);
    EXPECT_EQ(results[2].status, check_status::PASSED);
    EXPECT_DOUBLE_EQ(results[2].score, 1);
    EXPECT_DOUBLE_EQ(total_score(results), 1);
}
