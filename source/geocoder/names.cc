// Copyright (C) Karim Agha - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential. Authored by Karim Agha <karim@sentio.cloud>

#include "names.h"

namespace cpca::geocoder::names
{

std::unordered_map<std::string, std::string> const& province_aliases()
{
  static const std::unordered_map<std::string, std::string> aliases {
    // provinces
    { "广东", "广东省" },
    { "江苏", "江苏省" },
    { "浙江", "浙江省" },
    { "山东", "山东省" },
    { "河南", "河南省" },
    { "河北", "河北省" },
    { "四川", "四川省" },
    { "湖北", "湖北省" },
    { "湖南", "湖南省" },
    { "福建", "福建省" },
    { "安徽", "安徽省" },
    { "江西", "江西省" },
    { "陕西", "陕西省" },
    { "山西", "山西省" },
    { "辽宁", "辽宁省" },
    { "吉林", "吉林省" },
    { "黑龙江", "黑龙江省" },
    { "云南", "云南省" },
    { "贵州", "贵州省" },
    { "甘肃", "甘肃省" },
    { "海南", "海南省" },
    { "青海", "青海省" },
    { "台湾", "台湾省" },

    // autonomous regions
    { "广西", "广西壮族自治区" },
    { "内蒙古", "内蒙古自治区" },
    { "西藏", "西藏自治区" },
    { "新疆", "新疆维吾尔自治区" },
    { "宁夏", "宁夏回族自治区" },

    // municipalities
    { "北京", "北京市" },
    { "上海", "上海市" },
    { "天津", "天津市" },
    { "重庆", "重庆市" },

    // special administrative regions
    { "香港", "香港特别行政区" },
    { "澳门", "澳门特别行政区" }
  };
  return aliases;
}

}  // namespace cpca::geocoder::names
