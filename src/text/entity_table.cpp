#include <fidelity/text/entity_table.h>
#include <iterator>
#include <utility>

namespace fidelity::text {

namespace {

// Keys and values point at string literals, so the map never owns heap text.
constexpr std::pair<std::string_view, std::string_view> kNamedReferences[] = {
    // === Latin-1 Supplement (U+00A0-U+00FF) ===
    {"nbsp", "&#160;"},       // U+00A0
    {"iexcl", "&#161;"},      // U+00A1
    {"cent", "&#162;"},       // U+00A2
    {"pound", "&#163;"},      // U+00A3
    {"curren", "&#164;"},     // U+00A4
    {"yen", "&#165;"},        // U+00A5
    {"brvbar", "&#166;"},     // U+00A6
    {"sect", "&#167;"},       // U+00A7
    {"uml", "&#168;"},        // U+00A8
    {"copy", "&#169;"},       // U+00A9
    {"ordf", "&#170;"},       // U+00AA
    {"laquo", "&#171;"},      // U+00AB
    {"not", "&#172;"},        // U+00AC
    {"shy", "&#173;"},        // U+00AD
    {"reg", "&#174;"},        // U+00AE
    {"macr", "&#175;"},       // U+00AF
    {"deg", "&#176;"},        // U+00B0
    {"plusmn", "&#177;"},     // U+00B1
    {"sup2", "&#178;"},       // U+00B2
    {"sup3", "&#179;"},       // U+00B3
    {"acute", "&#180;"},      // U+00B4
    {"micro", "&#181;"},      // U+00B5
    {"para", "&#182;"},       // U+00B6
    {"middot", "&#183;"},     // U+00B7
    {"cedil", "&#184;"},      // U+00B8
    {"sup1", "&#185;"},       // U+00B9
    {"ordm", "&#186;"},       // U+00BA
    {"raquo", "&#187;"},      // U+00BB
    {"frac14", "&#188;"},     // U+00BC
    {"frac12", "&#189;"},     // U+00BD
    {"frac34", "&#190;"},     // U+00BE
    {"iquest", "&#191;"},     // U+00BF
    {"Agrave", "&#192;"},     // U+00C0
    {"Aacute", "&#193;"},     // U+00C1
    {"Acirc", "&#194;"},      // U+00C2
    {"Atilde", "&#195;"},     // U+00C3
    {"Auml", "&#196;"},       // U+00C4
    {"Aring", "&#197;"},      // U+00C5
    {"AElig", "&#198;"},      // U+00C6
    {"Ccedil", "&#199;"},     // U+00C7
    {"Egrave", "&#200;"},     // U+00C8
    {"Eacute", "&#201;"},     // U+00C9
    {"Ecirc", "&#202;"},      // U+00CA
    {"Euml", "&#203;"},       // U+00CB
    {"Igrave", "&#204;"},     // U+00CC
    {"Iacute", "&#205;"},     // U+00CD
    {"Icirc", "&#206;"},      // U+00CE
    {"Iuml", "&#207;"},       // U+00CF
    {"ETH", "&#208;"},        // U+00D0
    {"Ntilde", "&#209;"},     // U+00D1
    {"Ograve", "&#210;"},     // U+00D2
    {"Oacute", "&#211;"},     // U+00D3
    {"Ocirc", "&#212;"},      // U+00D4
    {"Otilde", "&#213;"},     // U+00D5
    {"Ouml", "&#214;"},       // U+00D6
    {"times", "&#215;"},      // U+00D7
    {"Oslash", "&#216;"},     // U+00D8
    {"Ugrave", "&#217;"},     // U+00D9
    {"Uacute", "&#218;"},     // U+00DA
    {"Ucirc", "&#219;"},      // U+00DB
    {"Uuml", "&#220;"},       // U+00DC
    {"Yacute", "&#221;"},     // U+00DD
    {"THORN", "&#222;"},      // U+00DE
    {"szlig", "&#223;"},      // U+00DF
    {"agrave", "&#224;"},     // U+00E0
    {"aacute", "&#225;"},     // U+00E1
    {"acirc", "&#226;"},      // U+00E2
    {"atilde", "&#227;"},     // U+00E3
    {"auml", "&#228;"},       // U+00E4
    {"aring", "&#229;"},      // U+00E5
    {"aelig", "&#230;"},      // U+00E6
    {"ccedil", "&#231;"},     // U+00E7
    {"egrave", "&#232;"},     // U+00E8
    {"eacute", "&#233;"},     // U+00E9
    {"ecirc", "&#234;"},      // U+00EA
    {"euml", "&#235;"},       // U+00EB
    {"igrave", "&#236;"},     // U+00EC
    {"iacute", "&#237;"},     // U+00ED
    {"icirc", "&#238;"},      // U+00EE
    {"iuml", "&#239;"},       // U+00EF
    {"eth", "&#240;"},        // U+00F0
    {"ntilde", "&#241;"},     // U+00F1
    {"ograve", "&#242;"},     // U+00F2
    {"oacute", "&#243;"},     // U+00F3
    {"ocirc", "&#244;"},      // U+00F4
    {"otilde", "&#245;"},     // U+00F5
    {"ouml", "&#246;"},       // U+00F6
    {"divide", "&#247;"},     // U+00F7
    {"oslash", "&#248;"},     // U+00F8
    {"ugrave", "&#249;"},     // U+00F9
    {"uacute", "&#250;"},     // U+00FA
    {"ucirc", "&#251;"},      // U+00FB
    {"uuml", "&#252;"},       // U+00FC
    {"yacute", "&#253;"},     // U+00FD
    {"thorn", "&#254;"},      // U+00FE
    {"yuml", "&#255;"},       // U+00FF

    // === Latin Extended, spacing modifiers and typographic punctuation ===
    {"OElig", "&#338;"},      // U+0152
    {"oelig", "&#339;"},      // U+0153
    {"Scaron", "&#352;"},     // U+0160
    {"scaron", "&#353;"},     // U+0161
    {"Yuml", "&#376;"},       // U+0178
    {"circ", "&#710;"},       // U+02C6
    {"tilde", "&#732;"},      // U+02DC
    {"ensp", "&#8194;"},      // U+2002
    {"emsp", "&#8195;"},      // U+2003
    {"thinsp", "&#8201;"},    // U+2009
    {"zwnj", "&#8204;"},      // U+200C
    {"zwj", "&#8205;"},       // U+200D
    {"lrm", "&#8206;"},       // U+200E
    {"rlm", "&#8207;"},       // U+200F
    {"ndash", "&#8211;"},     // U+2013
    {"mdash", "&#8212;"},     // U+2014
    {"lsquo", "&#8216;"},     // U+2018
    {"rsquo", "&#8217;"},     // U+2019
    {"sbquo", "&#8218;"},     // U+201A
    {"ldquo", "&#8220;"},     // U+201C
    {"rdquo", "&#8221;"},     // U+201D
    {"bdquo", "&#8222;"},     // U+201E
    {"dagger", "&#8224;"},    // U+2020
    {"Dagger", "&#8225;"},    // U+2021
    {"permil", "&#8240;"},    // U+2030
    {"lsaquo", "&#8249;"},    // U+2039
    {"rsaquo", "&#8250;"},    // U+203A
    {"euro", "&#8364;"},      // U+20AC

    // === Latin small f with hook, Greek letters and symbols ===
    {"fnof", "&#402;"},       // U+0192
    {"Alpha", "&#913;"},      // U+0391
    {"Beta", "&#914;"},       // U+0392
    {"Gamma", "&#915;"},      // U+0393
    {"Delta", "&#916;"},      // U+0394
    {"Epsilon", "&#917;"},    // U+0395
    {"Zeta", "&#918;"},       // U+0396
    {"Eta", "&#919;"},        // U+0397
    {"Theta", "&#920;"},      // U+0398
    {"Iota", "&#921;"},       // U+0399
    {"Kappa", "&#922;"},      // U+039A
    {"Lambda", "&#923;"},     // U+039B
    {"Mu", "&#924;"},         // U+039C
    {"Nu", "&#925;"},         // U+039D
    {"Xi", "&#926;"},         // U+039E
    {"Omicron", "&#927;"},    // U+039F
    {"Pi", "&#928;"},         // U+03A0
    {"Rho", "&#929;"},        // U+03A1
    {"Sigma", "&#931;"},      // U+03A3
    {"Tau", "&#932;"},        // U+03A4
    {"Upsilon", "&#933;"},    // U+03A5
    {"Phi", "&#934;"},        // U+03A6
    {"Chi", "&#935;"},        // U+03A7
    {"Psi", "&#936;"},        // U+03A8
    {"Omega", "&#937;"},      // U+03A9
    {"alpha", "&#945;"},      // U+03B1
    {"beta", "&#946;"},       // U+03B2
    {"gamma", "&#947;"},      // U+03B3
    {"delta", "&#948;"},      // U+03B4
    {"epsilon", "&#949;"},    // U+03B5
    {"zeta", "&#950;"},       // U+03B6
    {"eta", "&#951;"},        // U+03B7
    {"theta", "&#952;"},      // U+03B8
    {"iota", "&#953;"},       // U+03B9
    {"kappa", "&#954;"},      // U+03BA
    {"lambda", "&#955;"},     // U+03BB
    {"mu", "&#956;"},         // U+03BC
    {"nu", "&#957;"},         // U+03BD
    {"xi", "&#958;"},         // U+03BE
    {"omicron", "&#959;"},    // U+03BF
    {"pi", "&#960;"},         // U+03C0
    {"rho", "&#961;"},        // U+03C1
    {"sigmaf", "&#962;"},     // U+03C2
    {"sigma", "&#963;"},      // U+03C3
    {"tau", "&#964;"},        // U+03C4
    {"upsilon", "&#965;"},    // U+03C5
    {"phi", "&#966;"},        // U+03C6
    {"chi", "&#967;"},        // U+03C7
    {"psi", "&#968;"},        // U+03C8
    {"omega", "&#969;"},      // U+03C9
    {"thetasym", "&#977;"},   // U+03D1
    {"upsih", "&#978;"},      // U+03D2
    {"piv", "&#982;"},        // U+03D6

    // === General punctuation, letterlike symbols and arrows ===
    {"bull", "&#8226;"},      // U+2022
    {"hellip", "&#8230;"},    // U+2026
    {"prime", "&#8242;"},     // U+2032
    {"Prime", "&#8243;"},     // U+2033
    {"oline", "&#8254;"},     // U+203E
    {"frasl", "&#8260;"},     // U+2044
    {"weierp", "&#8472;"},    // U+2118
    {"image", "&#8465;"},     // U+2111
    {"real", "&#8476;"},      // U+211C
    {"trade", "&#8482;"},     // U+2122
    {"alefsym", "&#8501;"},   // U+2135
    {"larr", "&#8592;"},      // U+2190
    {"uarr", "&#8593;"},      // U+2191
    {"rarr", "&#8594;"},      // U+2192
    {"darr", "&#8595;"},      // U+2193
    {"harr", "&#8596;"},      // U+2194
    {"crarr", "&#8629;"},     // U+21B5
    {"lArr", "&#8656;"},      // U+21D0
    {"uArr", "&#8657;"},      // U+21D1
    {"rArr", "&#8658;"},      // U+21D2
    {"dArr", "&#8659;"},      // U+21D3
    {"hArr", "&#8660;"},      // U+21D4

    // === Mathematical operators ===
    {"forall", "&#8704;"},    // U+2200
    {"part", "&#8706;"},      // U+2202
    {"exist", "&#8707;"},     // U+2203
    {"empty", "&#8709;"},     // U+2205
    {"nabla", "&#8711;"},     // U+2207
    {"isin", "&#8712;"},      // U+2208
    {"notin", "&#8713;"},     // U+2209
    {"ni", "&#8715;"},        // U+220B
    {"prod", "&#8719;"},      // U+220F
    {"sum", "&#8721;"},       // U+2211
    {"minus", "&#8722;"},     // U+2212
    {"lowast", "&#8727;"},    // U+2217
    {"radic", "&#8730;"},     // U+221A
    {"prop", "&#8733;"},      // U+221D
    {"infin", "&#8734;"},     // U+221E
    {"ang", "&#8736;"},       // U+2220
    {"and", "&#8743;"},       // U+2227
    {"or", "&#8744;"},        // U+2228
    {"cap", "&#8745;"},       // U+2229
    {"cup", "&#8746;"},       // U+222A
    {"int", "&#8747;"},       // U+222B
    {"there4", "&#8756;"},    // U+2234
    {"sim", "&#8764;"},       // U+223C
    {"cong", "&#8773;"},      // U+2245
    {"asymp", "&#8776;"},     // U+2248
    {"ne", "&#8800;"},        // U+2260
    {"equiv", "&#8801;"},     // U+2261
    {"le", "&#8804;"},        // U+2264
    {"ge", "&#8805;"},        // U+2265
    {"sub", "&#8834;"},       // U+2282
    {"sup", "&#8835;"},       // U+2283
    {"nsub", "&#8836;"},      // U+2284
    {"sube", "&#8838;"},      // U+2286
    {"supe", "&#8839;"},      // U+2287
    {"oplus", "&#8853;"},     // U+2295
    {"otimes", "&#8855;"},    // U+2297
    {"perp", "&#8869;"},      // U+22A5
    {"sdot", "&#8901;"},      // U+22C5

    // === Miscellaneous technical, geometric shapes and card suits ===
    {"lceil", "&#8968;"},     // U+2308
    {"rceil", "&#8969;"},     // U+2309
    {"lfloor", "&#8970;"},    // U+230A
    {"rfloor", "&#8971;"},    // U+230B
    {"lang", "&#9001;"},      // U+2329
    {"rang", "&#9002;"},      // U+232A
    {"loz", "&#9674;"},       // U+25CA
    {"spades", "&#9824;"},    // U+2660
    {"clubs", "&#9827;"},     // U+2663
    {"hearts", "&#9829;"},    // U+2665
    {"diams", "&#9830;"},     // U+2666
};

} // namespace

const EntityTable& EntityTable::instance() {
    static const EntityTable table;
    return table;
}

EntityTable::EntityTable() {
    entries_.reserve(std::size(kNamedReferences));
    for (auto& [name, reference] : kNamedReferences) {
        entries_.emplace(name, reference);
    }
}

std::optional<std::string_view> EntityTable::lookup(std::string_view name) const {
    auto it = entries_.find(name);
    if (it == entries_.end()) return std::nullopt;
    return it->second;
}

bool is_reserved_entity(std::string_view name) {
    return name == "quot" || name == "amp" || name == "lt" ||
           name == "gt" || name == "apos";
}

} // namespace fidelity::text
