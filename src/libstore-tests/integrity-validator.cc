#include <gtest/gtest.h>

#include "chunkcache/store/cache-errors.hh"
#include "chunkcache/store/integrity-validator.hh"
#include "chunkcache/store/sqlite.hh"
#include "chunkcache/store/tests/artifacts.hh"
#include "chunkcache/store/tests/libstore.hh"

namespace chunkcache {

class IntegrityValidatorTest : public LibStoreTest
{
protected:
    SQLiteArtifactValidator validator{"wikipedia_articles", 1};
};

TEST_F(IntegrityValidatorTest, acceptsPopulatedDatabase)
{
    auto path = tmpDir + "/a.sqlite";
    makeSampleArtifact(path, 3);

    ASSERT_NO_THROW(validator.check(path));
    ASSERT_TRUE(validator.validate(path));
}

TEST_F(IntegrityValidatorTest, rejectsMissingFile)
{
    ASSERT_THROW(validator.check(tmpDir + "/nope"), CorruptArtifactError);
    ASSERT_FALSE(validator.validate(tmpDir + "/nope"));
}

TEST_F(IntegrityValidatorTest, rejectsDirectory)
{
    ASSERT_THROW(validator.check(tmpDir), CorruptArtifactError);
}

TEST_F(IntegrityValidatorTest, rejectsEmptyFile)
{
    auto path = tmpDir + "/empty";
    writeFile(path, "");
    ASSERT_THROW(validator.check(path), CorruptArtifactError);
}

TEST_F(IntegrityValidatorTest, rejectsGarbage)
{
    auto path = tmpDir + "/garbage";
    writeFile(path, makeNoise(8192));
    ASSERT_THROW(validator.check(path), CorruptArtifactError);
}

TEST_F(IntegrityValidatorTest, rejectsTruncatedDatabase)
{
    auto path = tmpDir + "/a.sqlite";
    makeSampleArtifact(path, 500, "wikipedia_articles", 200);
    auto contents = readFile(path);
    writeFile(path, contents.substr(0, contents.size() / 2));

    ASSERT_THROW(validator.check(path), CorruptArtifactError);
}

TEST_F(IntegrityValidatorTest, rejectsMissingTable)
{
    auto path = tmpDir + "/a.sqlite";
    makeSampleArtifact(path, 3, "other_table");
    ASSERT_THROW(validator.check(path), CorruptArtifactError);
}

TEST_F(IntegrityValidatorTest, rejectsEmptyTable)
{
    auto path = tmpDir + "/a.sqlite";
    makeSampleArtifact(path, 0);
    ASSERT_THROW(validator.check(path), CorruptArtifactError);
}

TEST_F(IntegrityValidatorTest, honoursMinRecords)
{
    auto path = tmpDir + "/a.sqlite";
    makeSampleArtifact(path, 5);

    SQLiteArtifactValidator strict("wikipedia_articles", 6);
    ASSERT_THROW(strict.check(path), CorruptArtifactError);

    SQLiteArtifactValidator lenient("wikipedia_articles", 5);
    ASSERT_NO_THROW(lenient.check(path));
}

TEST_F(IntegrityValidatorTest, quotesTableName)
{
    auto path = tmpDir + "/a.sqlite";
    makeSampleArtifact(path, 2, "odd \"name\"");

    SQLiteArtifactValidator odd("odd \"name\"", 2);
    ASSERT_NO_THROW(odd.check(path));
}

} // namespace chunkcache
