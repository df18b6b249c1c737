#define DOCTEST_CONFIG_TREAT_CHAR_STAR_AS_STRING
#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
#include <json-tree/json-tree.h>

#include <filesystem>
#include <fstream>

#include <stdio.h>

namespace json_tree_tests
{
	enum TEST_EXPECT
	{
		EXPECT_PASS,
		EXPECT_FAIL,
	};

	void
	iterate(const char* prefix, TEST_EXPECT expect)
	{
		for (const auto& f: std::filesystem::directory_iterator(TESTS_DIR))
		{
			if (f.is_regular_file() == false)
				continue;

			auto file = f.path().filename();
			if (file.extension() != ".json" || file.string().starts_with(prefix) == false)
				continue;

			SUBCASE(file.string().c_str())
			{
				std::ifstream ifs{f.path(), std::ios::binary};
				std::string file_content{std::istreambuf_iterator<char>{ifs}, std::istreambuf_iterator<char>{}};

				auto [json, err] = json_tree::decode(file_content);
				if (expect == EXPECT_PASS)
				{
					CHECK_MESSAGE(!err, err.msg);

					// whatever was accepted must survive a trip through the encoder
					auto [again, again_err] = json_tree::decode(json_tree::encode(json));
					CHECK_MESSAGE(!again_err, again_err.msg);
					CHECK(again == json);
				}
				else if (expect == EXPECT_FAIL)
				{
					auto name = file.string();
					CAPTURE(name);
					CAPTURE(file_content);
					CHECK_FALSE(!err);
				}
			}
		}
	}
}

TEST_SUITE("Must Accept")
{
	TEST_CASE("y_array")
	{
		json_tree_tests::iterate("y_array", json_tree_tests::EXPECT_PASS);
	}
	TEST_CASE("y_number")
	{
		json_tree_tests::iterate("y_number", json_tree_tests::EXPECT_PASS);
	}
	TEST_CASE("y_object")
	{
		json_tree_tests::iterate("y_object", json_tree_tests::EXPECT_PASS);
	}
	TEST_CASE("y_string")
	{
		json_tree_tests::iterate("y_string", json_tree_tests::EXPECT_PASS);
	}
	TEST_CASE("y_structure")
	{
		json_tree_tests::iterate("y_structure", json_tree_tests::EXPECT_PASS);
	}
}

TEST_SUITE("Must Reject")
{
	TEST_CASE("n_array")
	{
		json_tree_tests::iterate("n_array", json_tree_tests::EXPECT_FAIL);
	}
	TEST_CASE("n_number")
	{
		json_tree_tests::iterate("n_number", json_tree_tests::EXPECT_FAIL);
	}
	TEST_CASE("n_object")
	{
		json_tree_tests::iterate("n_object", json_tree_tests::EXPECT_FAIL);
	}
	TEST_CASE("n_string")
	{
		json_tree_tests::iterate("n_string", json_tree_tests::EXPECT_FAIL);
	}
	TEST_CASE("n_structure")
	{
		json_tree_tests::iterate("n_structure", json_tree_tests::EXPECT_FAIL);
	}
}

TEST_SUITE("Manual")
{
	TEST_CASE("Dump")
	{
		auto [doc, err] = json_tree::decode(R"(
		{
		  "name": "sensor-array",
		  "revision": 7,
		  "calibrated": true,
		  "owner": null,
		  "gain": 0.125,
		  "offset": -3.5e-3,
		  "channels": [
			{ "id": 0, "label": "north", "enabled": true },
			{ "id": 1, "label": "east\tside", "enabled": false },
			{ "id": 2, "label": "über", "enabled": true }
		  ],
		  "limits": { "min": -40, "max": 125, "unit": "°C" },
		  "tags": ["outdoor", "rev-b", ""]
		})");

		CHECK_MESSAGE(!err, err.msg);

		auto dump = json_tree::encode(doc);
		::puts(dump.c_str());

		auto [again, again_err] = json_tree::decode(dump);
		CHECK_MESSAGE(!again_err, again_err.msg);
		CHECK(json_tree::encode(again) == dump);

		auto [channels, channels_err] = doc.get("channels");
		REQUIRE_FALSE(channels_err);
		auto [label, label_err] = channels->at(1);
		REQUIRE_FALSE(label_err);
		auto [text, text_err] = label->get("label");
		REQUIRE_FALSE(text_err);
		CHECK(text->as_string().val == "east\tside");
	}
}
