/*
   ltag -- BCP 47 language tag library and tools

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   IANA language subtag registry: list of grandfathered tags and
   deprecated language and region codes with their preferred values
*/

#include "ltag/common_pch.h"

#include "ltag/iana_language_subtag_registry.h"

namespace ltag::iana::language_subtag_registry {

std::vector<grandfathered_entry_t> const g_grandfathered{
  { "art-lojban"s,  "jbo"s,             false, "Lojban"s },
  { "cel-gaulish"s, std::nullopt,       false, "Gaulish"s },
  { "en-GB-oed"s,   "en-GB-oxendict"s,  true,  "English, Oxford English Dictionary spelling"s },
  { "i-ami"s,       "ami"s,             true,  "Amis"s },
  { "i-bnn"s,       "bnn"s,             true,  "Bunun"s },
  { "i-default"s,   std::nullopt,       true,  "Default Language"s },
  { "i-enochian"s,  std::nullopt,       true,  "Enochian"s },
  { "i-hak"s,       "hak"s,             true,  "Hakka"s },
  { "i-klingon"s,   "tlh"s,             true,  "Klingon"s },
  { "i-lux"s,       "lb"s,              true,  "Luxembourgish"s },
  { "i-mingo"s,     std::nullopt,       true,  "Mingo"s },
  { "i-navajo"s,    "nv"s,              true,  "Navajo"s },
  { "i-pwn"s,       "pwn"s,             true,  "Paiwan"s },
  { "i-tao"s,       "tao"s,             true,  "Tao"s },
  { "i-tay"s,       "tay"s,             true,  "Tayal"s },
  { "i-tsu"s,       "tsu"s,             true,  "Tsou"s },
  { "no-bok"s,      "nb"s,              false, "Norwegian Bokmal"s },
  { "no-nyn"s,      "nn"s,              false, "Norwegian Nynorsk"s },
  { "sgn-BE-FR"s,   "sfb"s,             true,  "Belgian-French Sign Language"s },
  { "sgn-BE-NL"s,   "vgt"s,             true,  "Belgian-Flemish Sign Language"s },
  { "sgn-CH-DE"s,   "sgg"s,             true,  "Swiss German Sign Language"s },
  { "zh-guoyu"s,    "cmn"s,             false, "Mandarin or Standard Chinese"s },
  { "zh-hakka"s,    "hak"s,             false, "Hakka"s },
  { "zh-min"s,      std::nullopt,       false, "Min, Fuzhou, Hokkien, Amoy, or Taiwanese"s },
  { "zh-min-nan"s,  "nan"s,             false, "Minnan, Hokkien, Amoy, Taiwanese, Southern Min, Southern Fujian, Hoklo, Southern Fukien, Ho-lo"s },
  { "zh-xiang"s,    "hsn"s,             false, "Xiang or Hunanese"s },
};

std::vector<deprecated_entry_t> const g_deprecated_languages{
  { "in"s,   "id"s },
  { "iw"s,   "he"s },
  { "ji"s,   "yi"s },
  { "jw"s,   "jv"s },
  { "mo"s,   "ro"s },
  { "aam"s,  "aas"s },
  { "adp"s,  "dz"s },
  { "aue"s,  "ktz"s },
  { "ayx"s,  "nun"s },
  { "bjd"s,  "drl"s },
  { "ccq"s,  "rki"s },
  { "cjr"s,  "mom"s },
  { "cka"s,  "cmr"s },
  { "cmk"s,  "xch"s },
  { "drh"s,  "khk"s },
  { "drw"s,  "prs"s },
  { "gav"s,  "dev"s },
  { "gfx"s,  "vaj"s },
  { "gti"s,  "nyc"s },
  { "hrr"s,  "jal"s },
  { "ibi"s,  "opa"s },
  { "ilw"s,  "gal"s },
  { "kgh"s,  "kml"s },
  { "koj"s,  "kwv"s },
  { "kwq"s,  "yam"s },
  { "kxe"s,  "tvd"s },
  { "lii"s,  "raq"s },
  { "lmm"s,  "rmx"s },
  { "meg"s,  "cir"s },
  { "mst"s,  "mry"s },
  { "mwj"s,  "vaj"s },
  { "myt"s,  "mry"s },
  { "nnx"s,  "ngv"s },
  { "oun"s,  "vaj"s },
  { "pcr"s,  "adx"s },
  { "pmu"s,  "phr"s },
  { "ppr"s,  "lcq"s },
  { "puz"s,  "pub"s },
  { "sca"s,  "hle"s },
  { "thx"s,  "oyb"s },
  { "tie"s,  "ras"s },
  { "tkk"s,  "twm"s },
  { "tlw"s,  "weo"s },
  { "tnf"s,  "prs"s },
  { "tsf"s,  "taj"s },
  { "uok"s,  "ema"s },
  { "xia"s,  "acn"s },
  { "xsj"s,  "suj"s },
  { "ybd"s,  "rki"s },
  { "yma"s,  "lrr"s },
  { "ymt"s,  "mtm"s },
  { "yos"s,  "zom"s },
  { "yuu"s,  "yug"s },
};

std::vector<deprecated_entry_t> const g_deprecated_regions{
  { "BU"s, "MM"s },
  { "DD"s, "DE"s },
  { "FX"s, "FR"s },
  { "TP"s, "TL"s },
  { "YD"s, "YE"s },
  { "ZR"s, "CD"s },
};

} // namespace ltag::iana::language_subtag_registry
