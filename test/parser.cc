// Copyright (C) Karim Agha - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential. Authored by Karim Agha <karim@sentio.cloud>

#include <string>
#include <vector>
#include <optional>
#include <catch2/catch.hpp>

#include "mock_data.h"
#include "geocoder/names.h"
#include "geocoder/parser.h"

using cpca::model::parsed_address;

static void require_levels(
  parsed_address const& r,
  std::optional<std::string> province,
  std::optional<std::string> city,
  std::optional<std::string> district)
{
  REQUIRE(r.province == province);
  REQUIRE(r.city == city);
  REQUIRE(r.district == district);
}

TEST_CASE("Parser full addresses", "[parser]")
{
  auto const& p = test_parser();

  auto r = p.parse("广东省深圳市南山区科技园路1号");
  require_levels(r, "广东省", "深圳市", "南山区");
  REQUIRE(r.detail == "科技园路1号");
  REQUIRE(r.is_complete());

  r = p.parse("广西壮族自治区南宁市青秀区");
  require_levels(r, "广西壮族自治区", "南宁市", "青秀区");
  REQUIRE(r.detail.empty());

  r = p.parse("内蒙古自治区呼和浩特市");
  require_levels(r, "内蒙古自治区", "呼和浩特市", std::nullopt);

  r = p.parse("云南省大理白族自治州大理市");
  require_levels(r, "云南省", "大理白族自治州", "大理市");
}

TEST_CASE("Parser abbreviated names", "[parser]")
{
  auto const& p = test_parser();

  require_levels(p.parse("广东深圳市南山区"), "广东省", "深圳市", "南山区");
  require_levels(p.parse("广东省深圳南山区"), "广东省", "深圳市", "南山区");
  require_levels(p.parse("广东省深圳市南山"), "广东省", "深圳市", "南山区");
  require_levels(p.parse("广西南宁市"), "广西壮族自治区", "南宁市", std::nullopt);
  require_levels(p.parse("内蒙古呼和浩特"), "内蒙古自治区", "呼和浩特市", std::nullopt);

  auto r = p.parse("深圳南山科技园");
  require_levels(r, "广东省", "深圳市", "南山区");
  REQUIRE(r.detail == "科技园");
}

TEST_CASE("Parser infers missing upper levels", "[parser]")
{
  auto const& p = test_parser();

  require_levels(p.parse("深圳市南山区科技园"), "广东省", "深圳市", "南山区");
  require_levels(p.parse("杭州市西湖区"), "浙江省", "杭州市", "西湖区");
  require_levels(p.parse("成都武侯区"), "四川省", "成都市", "武侯区");

  auto r = p.parse("深圳市某某路");
  require_levels(r, "广东省", "深圳市", std::nullopt);
  REQUIRE(r.detail == "某某路");

  // province and district, the city comes from the district owners
  require_levels(p.parse("广东省南山区"), "广东省", "深圳市", "南山区");

  // unique district names resolve the whole hierarchy
  require_levels(p.parse("福田区"), "广东省", "深圳市", "福田区");
  require_levels(p.parse("康定市"), "四川省", "甘孜藏族自治州", "康定市");
  require_levels(p.parse("大理市"), "云南省", "大理白族自治州", "大理市");
  require_levels(p.parse("义乌市"), "浙江省", "金华市", "义乌市");
  require_levels(p.parse("昆山市"), "江苏省", "苏州市", "昆山市");
  require_levels(p.parse("寿光市"), "山东省", "潍坊市", "寿光市");

  // province plus abbreviated prefecture or county-level city
  require_levels(p.parse("云南大理"), "云南省", "大理白族自治州", "大理市");
  require_levels(p.parse("四川康定"), "四川省", "甘孜藏族自治州", "康定市");
}

TEST_CASE("Parser municipalities", "[parser]")
{
  auto const& p = test_parser();

  auto r = p.parse("北京市朝阳区望京");
  require_levels(r, "北京市", "北京市", "朝阳区");
  REQUIRE(r.detail == "望京");

  require_levels(p.parse("北京朝阳区"), "北京市", "北京市", "朝阳区");
  require_levels(p.parse("北京朝阳"), "北京市", "北京市", "朝阳区");
  require_levels(p.parse("上海市浦东新区陆家嘴"), "上海市", "上海市", "浦东新区");
  require_levels(p.parse("上海徐汇区漕河泾"), "上海市", "上海市", "徐汇区");
  require_levels(p.parse("重庆市渝中区解放碑"), "重庆市", "重庆市", "渝中区");
  require_levels(p.parse("天津市南开区"), "天津市", "天津市", "南开区");
  require_levels(p.parse("天津和平区"), "天津市", "天津市", "和平区");

  // districts of other cities are not taken for the municipality
  r = p.parse("北京市南山区");
  require_levels(r, "北京市", "北京市", std::nullopt);
  REQUIRE(r.detail == "南山区");

  for (auto const& municipality : cpca::geocoder::names::municipalities) {
    auto m = p.parse(std::string(municipality) + "某某大街1号");
    REQUIRE(m.province == std::string(municipality));
    REQUIRE(m.city == m.province);
    REQUIRE(m.detail == "某某大街1号");
  }
}

TEST_CASE("Parser cities without districts", "[parser]")
{
  auto const& p = test_parser();

  auto r = p.parse("广东省东莞市长安镇");
  require_levels(r, "广东省", "东莞市", std::nullopt);
  REQUIRE(r.detail == "长安镇");

  r = p.parse("广东省中山市小榄镇");
  require_levels(r, "广东省", "中山市", std::nullopt);
  REQUIRE(r.detail == "小榄镇");

  // a district name after such a city stays in the detail
  r = p.parse("东莞南山路");
  require_levels(r, "广东省", "东莞市", std::nullopt);
  REQUIRE(r.detail == "南山路");
}

TEST_CASE("Parser leaves ambiguous districts unresolved", "[parser]")
{
  auto const& p = test_parser();

  for (auto const& name : { "朝阳区", "南山区", "和平区" }) {
    auto r = p.parse(name);
    REQUIRE(r.district == std::string(name));
    REQUIRE_FALSE(r.has_province());
    REQUIRE_FALSE(r.has_city());
    REQUIRE(r.detail.empty());
  }

  // explicit context resolves them
  require_levels(p.parse("吉林省长春市朝阳区"), "吉林省", "长春市", "朝阳区");
  require_levels(p.parse("长春朝阳区"), "吉林省", "长春市", "朝阳区");
  require_levels(p.parse("深圳南山区"), "广东省", "深圳市", "南山区");
  require_levels(p.parse("沈阳和平区"), "辽宁省", "沈阳市", "和平区");
  require_levels(p.parse("黑龙江省鹤岗市南山区"), "黑龙江省", "鹤岗市", "南山区");
}

TEST_CASE("Parser prefers suffixed districts over shorter city names", "[parser]")
{
  auto const& p = test_parser();

  // 朝阳区 must not become the city 朝阳市 followed by 区
  auto r = p.parse("朝阳区");
  REQUIRE(r.district == "朝阳区");
  REQUIRE(r.city != std::optional<std::string>("朝阳市"));

  // with a province the city reading wins
  require_levels(p.parse("辽宁朝阳"), "辽宁省", "朝阳市", std::nullopt);
  require_levels(p.parse("辽宁省朝阳市"), "辽宁省", "朝阳市", std::nullopt);
  require_levels(p.parse("辽宁省朝阳市双塔区"), "辽宁省", "朝阳市", "双塔区");

  require_levels(p.parse("福田区"), "广东省", "深圳市", "福田区");
  require_levels(p.parse("宝安区"), "广东省", "深圳市", "宝安区");
}

TEST_CASE("Parser accepts abbreviated districts with colliding short names", "[parser]")
{
  auto const& p = test_parser();

  // 清河 is registered for 清河县, the city only knows 清河区
  auto r = p.parse("铁岭清河");
  REQUIRE(r.province == "辽宁省");
  REQUIRE(r.city == "铁岭市");
  REQUIRE(r.has_district());
  REQUIRE(r.detail.empty());

  require_levels(p.parse("辽宁省铁岭市清河区"), "辽宁省", "铁岭市", "清河区");
  require_levels(p.parse("邢台清河"), "河北省", "邢台市", "清河县");
}

TEST_CASE("Parser rejects cities of other provinces", "[parser]")
{
  auto const& p = test_parser();

  auto r = p.parse("广东省杭州市西湖区");
  REQUIRE(r.province == "广东省");
  REQUIRE_FALSE(r.has_city());
  REQUIRE_FALSE(r.has_district());
  REQUIRE(r.detail == "杭州市西湖区");
}

TEST_CASE("Parser edge cases", "[parser]")
{
  auto const& p = test_parser();

  for (auto const& blank : { "", "   ", "\t\n", "\xe3\x80\x80" }) {
    auto r = p.parse(blank);
    require_levels(r, std::nullopt, std::nullopt, std::nullopt);
    REQUIRE(r.detail.empty());
  }

  auto r = p.parse("某某路123号");
  require_levels(r, std::nullopt, std::nullopt, std::nullopt);
  REQUIRE(r.detail == "某某路123号");

  r = p.parse("  广东省深圳市南山区  科技园  ");
  require_levels(r, "广东省", "深圳市", "南山区");
  REQUIRE(r.detail == "科技园");

  // spaces between levels stop the matching
  r = p.parse("  广东省  深圳市  南山区  ");
  REQUIRE(r.province == "广东省");
  REQUIRE_FALSE(r.has_city());
  REQUIRE(r.detail == "深圳市  南山区");

  // invalid UTF-8 degrades to detail
  r = p.parse("\xff广东省");
  REQUIRE_FALSE(r.has_province());
  REQUIRE(r.detail == "\xff广东省");
}

TEST_CASE("Parser recovers every gazetteer entry", "[parser]")
{
  auto const& p = test_parser();
  std::string const suffix = "建设路88号";

  for (auto const& record : gazetteer_records()) {
    std::string text = p.index().is_municipality(record.province)
      ? record.province + record.district.value_or("") + suffix
      : record.full_name() + suffix;

    auto r = p.parse(text);
    INFO(text);
    REQUIRE(r.province == record.province);
    REQUIRE(r.city == record.city);
    REQUIRE(r.district == record.district);
    REQUIRE(r.detail == suffix);
  }
}

TEST_CASE("Parser treats province aliases like full names", "[parser]")
{
  auto const& p = test_parser();
  for (auto const& [alias, province] : cpca::geocoder::names::province_aliases()) {
    INFO(alias);
    auto by_alias = p.parse(alias + "人民路1号");
    auto by_name = p.parse(province + "人民路1号");
    REQUIRE(by_alias.province == by_name.province);
  }
}

TEST_CASE("Parser batch keeps input order", "[parser]")
{
  auto const& p = test_parser();

  std::vector<std::string> texts { 
    "广东省深圳市南山区", "北京市朝阳区", "上海市浦东新区", "", "某某路" 
  };

  auto results = p.parse_batch(texts);
  REQUIRE(results.size() == texts.size());
  for (size_t i = 0; i < texts.size(); ++i) {
    REQUIRE(results[i] == p.parse(texts[i]));
  }
  REQUIRE(results[0].province == "广东省");
  REQUIRE(results[1].province == "北京市");
  REQUIRE(results[2].province == "上海市");
  REQUIRE_FALSE(results[3].has_province());

  REQUIRE(p.parse_batch({}).empty());
}

TEST_CASE("Parser address validity", "[parser]")
{
  auto const& p = test_parser();

  REQUIRE(p.is_valid_address("广东省深圳市"));
  REQUIRE(p.is_valid_address("深圳市"));
  REQUIRE(p.is_valid_address("北京"));
  REQUIRE_FALSE(p.is_valid_address("某某路123号"));
  REQUIRE_FALSE(p.is_valid_address(""));

  // a district alone is not enough when it cannot be placed
  REQUIRE_FALSE(p.is_valid_address("朝阳区"));
  REQUIRE(p.is_valid_address("福田区"));
}
