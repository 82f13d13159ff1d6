#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "io/csv_writer.hpp"
#include "io/json_array_writer.hpp"
#include "io/xml_writer.hpp"
#include "test_utils.hpp"

using namespace iotrans;

TEST_CASE("CsvWriter - field escaping") {
    CHECK(io::CsvWriter::escapeField("plain") == "plain");
    CHECK(io::CsvWriter::escapeField("a,b") == "\"a,b\"");
    CHECK(io::CsvWriter::escapeField("say \"hi\"") == "\"say \"\"hi\"\"\"");
    CHECK(io::CsvWriter::escapeField("two\nlines") == "\"two\nlines\"");
    CHECK(io::CsvWriter::escapeField("") == "");
    CHECK(io::CsvWriter::formatRow({"a", "b,c", ""}) == "a,\"b,c\",");
}

TEST_CASE("CsvWriter - text values") {
    CHECK(io::formatTextValue(Json()) == "");
    CHECK(io::formatTextValue(Json(true)) == "true");
    CHECK(io::formatTextValue(Json(42)) == "42");
    CHECK(io::formatTextValue(Json(1.5)) == "1.5");
    CHECK(io::formatTextValue(Json("text")) == "text");
    CHECK(io::formatTextValue(Json::parse(R"({"a":[1,2]})")) == R"({"a":[1,2]})");
}

TEST_CASE("CsvWriter - rows in column order") {
    iotrans_test::TempDir dir("iotrans-csv");

    io::CsvWriterConfig config;
    config.output_file_path = (dir.path() / "out.csv").string();
    config.columns = {"id", "name", "the year"};

    io::VectorRecordStream records(std::vector<Record>{
        Json{{"id", 1}, {"name", "a,b"}, {"the year", 2020}},
        Json{{"name", "say \"hi\""}, {"id", 2}},
        Json{{"id", 3}, {"name", "multi\nline"}, {"the year", nullptr}},
    });

    io::CsvWriter writer;
    REQUIRE(writer.writeRecords(config, records));
    CHECK(writer.getWrittenCount() == 3);

    CHECK(iotrans_test::readFile(config.output_file_path) ==
          "id,name,the year\r\n"
          "1,\"a,b\",2020\r\n"
          "2,\"say \"\"hi\"\"\",\r\n"
          "3,\"multi\nline\",\r\n");
}

TEST_CASE("CsvWriter - unbounded field size") {
    iotrans_test::TempDir dir("iotrans-csv-large");

    io::CsvWriterConfig config;
    config.output_file_path = (dir.path() / "large.csv").string();
    config.columns = {"geometry"};

    std::string large(1 << 20, 'x');
    io::VectorRecordStream records(std::vector<Record>{Json{{"geometry", large}}});

    io::CsvWriter writer;
    REQUIRE(writer.writeRecords(config, records));
    CHECK(iotrans_test::readFile(config.output_file_path) == "geometry\r\n" + large + "\r\n");
}

TEST_CASE("CsvWriter - failures are reported") {
    io::CsvWriterConfig config;
    config.output_file_path = "/nonexistent-dir/out.csv";
    config.columns = {"id"};

    io::VectorRecordStream records{std::vector<Record>()};
    io::CsvWriter writer;
    CHECK_FALSE(writer.writeRecords(config, records));
    CHECK(writer.getLastError().find("/nonexistent-dir/out.csv") != std::string::npos);

    writer.clearError();
    CHECK(writer.getLastError().empty());
}

TEST_CASE("JsonArrayWriter - always a valid array") {
    iotrans_test::TempDir dir("iotrans-json");
    const std::string path = (dir.path() / "out.json").string();
    io::JsonArrayWriter writer;

    SUBCASE("Zero records") {
        io::VectorRecordStream records{std::vector<Record>()};
        REQUIRE(writer.writeRecords(path, records));
        CHECK(iotrans_test::readFile(path) == "[]\n");
    }

    SUBCASE("One record") {
        io::VectorRecordStream records(std::vector<Record>{Json{{"id", 1}, {"name", "a"}}});
        REQUIRE(writer.writeRecords(path, records));
        CHECK(iotrans_test::readFile(path) == "[{\"id\":1,\"name\":\"a\"}]\n");
    }

    SUBCASE("Many records") {
        std::vector<Record> input;
        for (int i = 0; i < 25; ++i) {
            input.push_back(Json{{"id", i}, {"text", "row,\"" + std::to_string(i) + "\""}});
        }
        io::VectorRecordStream records(input);
        REQUIRE(writer.writeRecords(path, records));
        CHECK(writer.getWrittenCount() == 25);

        Json parsed = Json::parse(iotrans_test::readFile(path));
        REQUIRE(parsed.is_array());
        CHECK(parsed.size() == 25);
        CHECK(parsed[24]["text"] == "row,\"24\"");
    }
}

TEST_CASE("XmlWriter - tag name sanitization") {
    CHECK(io::XmlWriter::sanitizeTagName("name") == "name");
    CHECK(io::XmlWriter::sanitizeTagName("the year") == "theyear");
    CHECK(io::XmlWriter::sanitizeTagName("a.b/c") == "abc");
    CHECK(io::XmlWriter::sanitizeTagName("1st") == "_1st");
    CHECK(io::XmlWriter::sanitizeTagName("-dash") == "_-dash");
    CHECK(io::XmlWriter::sanitizeTagName("_id") == "_id");
    CHECK(io::XmlWriter::sanitizeTagName("my-field_2") == "my-field_2");
    CHECK(io::XmlWriter::sanitizeTagName("%%") == "_");
}

TEST_CASE("XmlWriter - document layout") {
    iotrans_test::TempDir dir("iotrans-xml");

    io::XmlWriterConfig config;
    config.output_file_path = (dir.path() / "out.xml").string();

    SUBCASE("Rows, counts and escaping") {
        io::VectorRecordStream records(std::vector<Record>{
            Json{{"the year", 2020}, {"1st", "a<b & c"}, {"_id", 1}},
            Json{{"the year", nullptr}, {"1st", true}, {"_id", 2}},
        });

        io::XmlWriter writer;
        REQUIRE(writer.writeRecords(config, records));
        CHECK(iotrans_test::readFile(config.output_file_path) ==
              "<?xml version=\"1.0\" encoding=\"utf-8\"?>\n"
              "<DATA>"
              "<ROW count=\"0\"><theyear>2020</theyear><_1st>a&lt;b &amp; c</_1st><_id>1</_id></ROW>"
              "<ROW count=\"1\"><theyear></theyear><_1st>true</_1st><_id>2</_id></ROW>"
              "</DATA>");
    }

    SUBCASE("Chunked writes keep every row") {
        config.chunk_size = 2;
        std::vector<Record> input;
        for (int i = 0; i < 5; ++i) {
            input.push_back(Json{{"id", i}});
        }
        io::VectorRecordStream records(input);

        io::XmlWriter writer;
        REQUIRE(writer.writeRecords(config, records));
        CHECK(writer.getWrittenCount() == 5);

        std::string content = iotrans_test::readFile(config.output_file_path);
        CHECK(content.find("<ROW count=\"4\"><id>4</id></ROW></DATA>") != std::string::npos);
    }

    SUBCASE("Empty stream") {
        io::VectorRecordStream records{std::vector<Record>()};
        io::XmlWriter writer;
        REQUIRE(writer.writeRecords(config, records));
        CHECK(iotrans_test::readFile(config.output_file_path) ==
              "<?xml version=\"1.0\" encoding=\"utf-8\"?>\n<DATA></DATA>");
    }
}
