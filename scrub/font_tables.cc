// -*- mode: c++; -*-
// Copyright 2001-2003 Glyph & Cog, LLC

#include <defs.hh>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <string>

#include <scrub/font_tables.hh>

namespace scrub {

const char* standard_encoding [256] = {
    0, 0, 0, 0,
    0, 0, 0, 0,
    0, 0, 0, 0,
    0, 0, 0, 0,
    0, 0, 0, 0,
    0, 0, 0, 0,
    0, 0, 0, 0,
    0, 0, 0, 0,
    "space", "exclam", "quotedbl", "numbersign",
    "dollar", "percent", "ampersand", "quoteright",
    "parenleft", "parenright", "asterisk", "plus",
    "comma", "hyphen", "period", "slash",
    "zero", "one", "two", "three",
    "four", "five", "six", "seven",
    "eight", "nine", "colon", "semicolon",
    "less", "equal", "greater", "question",
    "at", "A", "B", "C",
    "D", "E", "F", "G",
    "H", "I", "J", "K",
    "L", "M", "N", "O",
    "P", "Q", "R", "S",
    "T", "U", "V", "W",
    "X", "Y", "Z", "bracketleft",
    "backslash", "bracketright", "asciicircum", "underscore",
    "quoteleft", "a", "b", "c",
    "d", "e", "f", "g",
    "h", "i", "j", "k",
    "l", "m", "n", "o",
    "p", "q", "r", "s",
    "t", "u", "v", "w",
    "x", "y", "z", "braceleft",
    "bar", "braceright", "asciitilde", 0,
    0, 0, 0, 0,
    0, 0, 0, 0,
    0, 0, 0, 0,
    0, 0, 0, 0,
    0, 0, 0, 0,
    0, 0, 0, 0,
    0, 0, 0, 0,
    0, 0, 0, 0,
    0, "exclamdown", "cent", "sterling",
    "fraction", "yen", "florin", "section",
    "currency", "quotesingle", "quotedblleft", "guillemotleft",
    "guilsinglleft", "guilsinglright", "fi", "fl",
    0, "endash", "dagger", "daggerdbl",
    "periodcentered", 0, "paragraph", "bullet",
    "quotesinglbase", "quotedblbase", "quotedblright", "guillemotright",
    "ellipsis", "perthousand", 0, "questiondown",
    0, "grave", "acute", "circumflex",
    "tilde", "macron", "breve", "dotaccent",
    "dieresis", 0, "ring", "cedilla",
    0, "hungarumlaut", "ogonek", "caron",
    "emdash", 0, 0, 0,
    0, 0, 0, 0,
    0, 0, 0, 0,
    0, 0, 0, 0,
    0, "AE", 0, "ordfeminine",
    0, 0, 0, 0,
    "Lslash", "Oslash", "OE", "ordmasculine",
    0, 0, 0, 0,
    0, "ae", 0, 0,
    0, "dotlessi", 0, 0,
    "lslash", "oslash", "oe", "germandbls",
    0, 0, 0, 0
};

const char* win_ansi_encoding [256] = {
    0, 0, 0, 0,
    0, 0, 0, 0,
    0, 0, 0, 0,
    0, 0, 0, 0,
    0, 0, 0, 0,
    0, 0, 0, 0,
    0, 0, 0, 0,
    0, 0, 0, 0,
    "space", "exclam", "quotedbl", "numbersign",
    "dollar", "percent", "ampersand", "quotesingle",
    "parenleft", "parenright", "asterisk", "plus",
    "comma", "hyphen", "period", "slash",
    "zero", "one", "two", "three",
    "four", "five", "six", "seven",
    "eight", "nine", "colon", "semicolon",
    "less", "equal", "greater", "question",
    "at", "A", "B", "C",
    "D", "E", "F", "G",
    "H", "I", "J", "K",
    "L", "M", "N", "O",
    "P", "Q", "R", "S",
    "T", "U", "V", "W",
    "X", "Y", "Z", "bracketleft",
    "backslash", "bracketright", "asciicircum", "underscore",
    "grave", "a", "b", "c",
    "d", "e", "f", "g",
    "h", "i", "j", "k",
    "l", "m", "n", "o",
    "p", "q", "r", "s",
    "t", "u", "v", "w",
    "x", "y", "z", "braceleft",
    "bar", "braceright", "asciitilde", 0,
    "Euro", 0, "quotesinglbase", "florin",
    "quotedblbase", "ellipsis", "dagger", "daggerdbl",
    "circumflex", "perthousand", "Scaron", "guilsinglleft",
    "OE", 0, "Zcaron", 0,
    0, "quoteleft", "quoteright", "quotedblleft",
    "quotedblright", "bullet", "endash", "emdash",
    "tilde", "trademark", "scaron", "guilsinglright",
    "oe", 0, "zcaron", "Ydieresis",
    "space", "exclamdown", "cent", "sterling",
    "currency", "yen", "brokenbar", "section",
    "dieresis", "copyright", "ordfeminine", "guillemotleft",
    "logicalnot", "hyphen", "registered", "macron",
    "degree", "plusminus", "twosuperior", "threesuperior",
    "acute", "mu", "paragraph", "periodcentered",
    "cedilla", "onesuperior", "ordmasculine", "guillemotright",
    "onequarter", "onehalf", "threequarters", "questiondown",
    "Agrave", "Aacute", "Acircumflex", "Atilde",
    "Adieresis", "Aring", "AE", "Ccedilla",
    "Egrave", "Eacute", "Ecircumflex", "Edieresis",
    "Igrave", "Iacute", "Icircumflex", "Idieresis",
    "Eth", "Ntilde", "Ograve", "Oacute",
    "Ocircumflex", "Otilde", "Odieresis", "multiply",
    "Oslash", "Ugrave", "Uacute", "Ucircumflex",
    "Udieresis", "Yacute", "Thorn", "germandbls",
    "agrave", "aacute", "acircumflex", "atilde",
    "adieresis", "aring", "ae", "ccedilla",
    "egrave", "eacute", "ecircumflex", "edieresis",
    "igrave", "iacute", "icircumflex", "idieresis",
    "eth", "ntilde", "ograve", "oacute",
    "ocircumflex", "otilde", "odieresis", "divide",
    "oslash", "ugrave", "uacute", "ucircumflex",
    "udieresis", "yacute", "thorn", "ydieresis"
};

const char* mac_roman_encoding [256] = {
    0, 0, 0, 0,
    0, 0, 0, 0,
    0, 0, 0, 0,
    0, 0, 0, 0,
    0, 0, 0, 0,
    0, 0, 0, 0,
    0, 0, 0, 0,
    0, 0, 0, 0,
    "space", "exclam", "quotedbl", "numbersign",
    "dollar", "percent", "ampersand", "quotesingle",
    "parenleft", "parenright", "asterisk", "plus",
    "comma", "hyphen", "period", "slash",
    "zero", "one", "two", "three",
    "four", "five", "six", "seven",
    "eight", "nine", "colon", "semicolon",
    "less", "equal", "greater", "question",
    "at", "A", "B", "C",
    "D", "E", "F", "G",
    "H", "I", "J", "K",
    "L", "M", "N", "O",
    "P", "Q", "R", "S",
    "T", "U", "V", "W",
    "X", "Y", "Z", "bracketleft",
    "backslash", "bracketright", "asciicircum", "underscore",
    "grave", "a", "b", "c",
    "d", "e", "f", "g",
    "h", "i", "j", "k",
    "l", "m", "n", "o",
    "p", "q", "r", "s",
    "t", "u", "v", "w",
    "x", "y", "z", "braceleft",
    "bar", "braceright", "asciitilde", 0,
    "Adieresis", "Aring", "Ccedilla", "Eacute",
    "Ntilde", "Odieresis", "Udieresis", "aacute",
    "agrave", "acircumflex", "adieresis", "atilde",
    "aring", "ccedilla", "eacute", "egrave",
    "ecircumflex", "edieresis", "iacute", "igrave",
    "icircumflex", "idieresis", "ntilde", "oacute",
    "ograve", "ocircumflex", "odieresis", "otilde",
    "uacute", "ugrave", "ucircumflex", "udieresis",
    "dagger", "degree", "cent", "sterling",
    "section", "bullet", "paragraph", "germandbls",
    "registered", "copyright", "trademark", "acute",
    "dieresis", "notequal", "AE", "Oslash",
    "infinity", "plusminus", "lessequal", "greaterequal",
    "yen", "mu", "partialdiff", "summation",
    "product", "pi", "integral", "ordfeminine",
    "ordmasculine", "Omega", "ae", "oslash",
    "questiondown", "exclamdown", "logicalnot", "radical",
    "florin", "approxequal", "Delta", "guillemotleft",
    "guillemotright", "ellipsis", "space", "Agrave",
    "Atilde", "Otilde", "OE", "oe",
    "endash", "emdash", "quotedblleft", "quotedblright",
    "quoteleft", "quoteright", "divide", "lozenge",
    "ydieresis", "Ydieresis", "fraction", "currency",
    "guilsinglleft", "guilsinglright", "fi", "fl",
    "daggerdbl", "periodcentered", "quotesinglbase", "quotedblbase",
    "perthousand", "Acircumflex", "Ecircumflex", "Aacute",
    "Edieresis", "Egrave", "Iacute", "Icircumflex",
    "Idieresis", "Igrave", "Oacute", "Ocircumflex",
    "apple", "Ograve", "Uacute", "Ucircumflex",
    "Ugrave", "dotlessi", "circumflex", "tilde",
    "macron", "breve", "dotaccent", "ring",
    "cedilla", "hungarumlaut", "ogonek", "caron"
};

//
// Sorted by name:
//
const glyph_unicode_t glyph_unicode_table [] = {
    { "A", 0x0041 },
    { "AE", 0x00C6 },
    { "Aacute", 0x00C1 },
    { "Acircumflex", 0x00C2 },
    { "Adieresis", 0x00C4 },
    { "Agrave", 0x00C0 },
    { "Aring", 0x00C5 },
    { "Atilde", 0x00C3 },
    { "B", 0x0042 },
    { "C", 0x0043 },
    { "Ccedilla", 0x00C7 },
    { "D", 0x0044 },
    { "Dcroat", 0x0110 },
    { "Delta", 0x2206 },
    { "E", 0x0045 },
    { "Eacute", 0x00C9 },
    { "Ecircumflex", 0x00CA },
    { "Edieresis", 0x00CB },
    { "Egrave", 0x00C8 },
    { "Eth", 0x00D0 },
    { "Euro", 0x20AC },
    { "F", 0x0046 },
    { "G", 0x0047 },
    { "H", 0x0048 },
    { "I", 0x0049 },
    { "Iacute", 0x00CD },
    { "Icircumflex", 0x00CE },
    { "Idieresis", 0x00CF },
    { "Igrave", 0x00CC },
    { "J", 0x004A },
    { "K", 0x004B },
    { "L", 0x004C },
    { "Lslash", 0x0141 },
    { "M", 0x004D },
    { "N", 0x004E },
    { "Ntilde", 0x00D1 },
    { "O", 0x004F },
    { "OE", 0x0152 },
    { "Oacute", 0x00D3 },
    { "Ocircumflex", 0x00D4 },
    { "Odieresis", 0x00D6 },
    { "Ograve", 0x00D2 },
    { "Omega", 0x2126 },
    { "Oslash", 0x00D8 },
    { "Otilde", 0x00D5 },
    { "P", 0x0050 },
    { "Q", 0x0051 },
    { "R", 0x0052 },
    { "S", 0x0053 },
    { "Scaron", 0x0160 },
    { "T", 0x0054 },
    { "Thorn", 0x00DE },
    { "U", 0x0055 },
    { "Uacute", 0x00DA },
    { "Ucircumflex", 0x00DB },
    { "Udieresis", 0x00DC },
    { "Ugrave", 0x00D9 },
    { "V", 0x0056 },
    { "W", 0x0057 },
    { "X", 0x0058 },
    { "Y", 0x0059 },
    { "Yacute", 0x00DD },
    { "Ydieresis", 0x0178 },
    { "Z", 0x005A },
    { "Zcaron", 0x017D },
    { "a", 0x0061 },
    { "aacute", 0x00E1 },
    { "acircumflex", 0x00E2 },
    { "acute", 0x00B4 },
    { "adieresis", 0x00E4 },
    { "ae", 0x00E6 },
    { "agrave", 0x00E0 },
    { "ampersand", 0x0026 },
    { "apple", 0xF8FF },
    { "approxequal", 0x2248 },
    { "aring", 0x00E5 },
    { "asciicircum", 0x005E },
    { "asciitilde", 0x007E },
    { "asterisk", 0x002A },
    { "at", 0x0040 },
    { "atilde", 0x00E3 },
    { "b", 0x0062 },
    { "backslash", 0x005C },
    { "bar", 0x007C },
    { "braceleft", 0x007B },
    { "braceright", 0x007D },
    { "bracketleft", 0x005B },
    { "bracketright", 0x005D },
    { "breve", 0x02D8 },
    { "brokenbar", 0x00A6 },
    { "bullet", 0x2022 },
    { "c", 0x0063 },
    { "caron", 0x02C7 },
    { "ccedilla", 0x00E7 },
    { "cedilla", 0x00B8 },
    { "cent", 0x00A2 },
    { "circumflex", 0x02C6 },
    { "colon", 0x003A },
    { "comma", 0x002C },
    { "copyright", 0x00A9 },
    { "currency", 0x00A4 },
    { "d", 0x0064 },
    { "dagger", 0x2020 },
    { "daggerdbl", 0x2021 },
    { "dcroat", 0x0111 },
    { "degree", 0x00B0 },
    { "dieresis", 0x00A8 },
    { "divide", 0x00F7 },
    { "dollar", 0x0024 },
    { "dotaccent", 0x02D9 },
    { "dotlessi", 0x0131 },
    { "e", 0x0065 },
    { "eacute", 0x00E9 },
    { "ecircumflex", 0x00EA },
    { "edieresis", 0x00EB },
    { "egrave", 0x00E8 },
    { "eight", 0x0038 },
    { "ellipsis", 0x2026 },
    { "emdash", 0x2014 },
    { "endash", 0x2013 },
    { "equal", 0x003D },
    { "eth", 0x00F0 },
    { "exclam", 0x0021 },
    { "exclamdown", 0x00A1 },
    { "f", 0x0066 },
    { "ff", 0xFB00 },
    { "ffi", 0xFB03 },
    { "ffl", 0xFB04 },
    { "fi", 0xFB01 },
    { "five", 0x0035 },
    { "fl", 0xFB02 },
    { "florin", 0x0192 },
    { "four", 0x0034 },
    { "fraction", 0x2044 },
    { "g", 0x0067 },
    { "germandbls", 0x00DF },
    { "grave", 0x0060 },
    { "greater", 0x003E },
    { "greaterequal", 0x2265 },
    { "guillemotleft", 0x00AB },
    { "guillemotright", 0x00BB },
    { "guilsinglleft", 0x2039 },
    { "guilsinglright", 0x203A },
    { "h", 0x0068 },
    { "hungarumlaut", 0x02DD },
    { "hyphen", 0x002D },
    { "i", 0x0069 },
    { "iacute", 0x00ED },
    { "icircumflex", 0x00EE },
    { "idieresis", 0x00EF },
    { "igrave", 0x00EC },
    { "infinity", 0x221E },
    { "integral", 0x222B },
    { "j", 0x006A },
    { "k", 0x006B },
    { "l", 0x006C },
    { "less", 0x003C },
    { "lessequal", 0x2264 },
    { "logicalnot", 0x00AC },
    { "lozenge", 0x25CA },
    { "lslash", 0x0142 },
    { "m", 0x006D },
    { "macron", 0x00AF },
    { "minus", 0x2212 },
    { "mu", 0x00B5 },
    { "multiply", 0x00D7 },
    { "n", 0x006E },
    { "nbspace", 0x00A0 },
    { "nine", 0x0039 },
    { "notequal", 0x2260 },
    { "ntilde", 0x00F1 },
    { "numbersign", 0x0023 },
    { "o", 0x006F },
    { "oacute", 0x00F3 },
    { "ocircumflex", 0x00F4 },
    { "odieresis", 0x00F6 },
    { "oe", 0x0153 },
    { "ogonek", 0x02DB },
    { "ograve", 0x00F2 },
    { "one", 0x0031 },
    { "onehalf", 0x00BD },
    { "onequarter", 0x00BC },
    { "onesuperior", 0x00B9 },
    { "ordfeminine", 0x00AA },
    { "ordmasculine", 0x00BA },
    { "oslash", 0x00F8 },
    { "otilde", 0x00F5 },
    { "p", 0x0070 },
    { "paragraph", 0x00B6 },
    { "parenleft", 0x0028 },
    { "parenright", 0x0029 },
    { "partialdiff", 0x2202 },
    { "percent", 0x0025 },
    { "period", 0x002E },
    { "periodcentered", 0x00B7 },
    { "perthousand", 0x2030 },
    { "pi", 0x03C0 },
    { "plus", 0x002B },
    { "plusminus", 0x00B1 },
    { "product", 0x220F },
    { "q", 0x0071 },
    { "question", 0x003F },
    { "questiondown", 0x00BF },
    { "quotedbl", 0x0022 },
    { "quotedblbase", 0x201E },
    { "quotedblleft", 0x201C },
    { "quotedblright", 0x201D },
    { "quoteleft", 0x2018 },
    { "quoteright", 0x2019 },
    { "quotesinglbase", 0x201A },
    { "quotesingle", 0x0027 },
    { "r", 0x0072 },
    { "radical", 0x221A },
    { "registered", 0x00AE },
    { "ring", 0x02DA },
    { "s", 0x0073 },
    { "scaron", 0x0161 },
    { "section", 0x00A7 },
    { "semicolon", 0x003B },
    { "seven", 0x0037 },
    { "sfthyphen", 0x00AD },
    { "six", 0x0036 },
    { "slash", 0x002F },
    { "space", 0x0020 },
    { "sterling", 0x00A3 },
    { "summation", 0x2211 },
    { "t", 0x0074 },
    { "thorn", 0x00FE },
    { "three", 0x0033 },
    { "threequarters", 0x00BE },
    { "threesuperior", 0x00B3 },
    { "tilde", 0x02DC },
    { "trademark", 0x2122 },
    { "two", 0x0032 },
    { "twosuperior", 0x00B2 },
    { "u", 0x0075 },
    { "uacute", 0x00FA },
    { "ucircumflex", 0x00FB },
    { "udieresis", 0x00FC },
    { "ugrave", 0x00F9 },
    { "underscore", 0x005F },
    { "v", 0x0076 },
    { "w", 0x0077 },
    { "x", 0x0078 },
    { "y", 0x0079 },
    { "yacute", 0x00FD },
    { "ydieresis", 0x00FF },
    { "yen", 0x00A5 },
    { "z", 0x007A },
    { "zcaron", 0x017E },
    { "zero", 0x0030 }
};

const size_t glyph_unicode_table_size =
    sizeof glyph_unicode_table / sizeof *glyph_unicode_table;

static const glyph_width_t helvetica_widths [] = {
    { "A", 667 },
    { "B", 667 },
    { "C", 722 },
    { "D", 722 },
    { "E", 667 },
    { "F", 611 },
    { "G", 778 },
    { "H", 722 },
    { "I", 278 },
    { "J", 500 },
    { "K", 667 },
    { "L", 556 },
    { "M", 833 },
    { "N", 722 },
    { "O", 778 },
    { "P", 667 },
    { "Q", 778 },
    { "R", 722 },
    { "S", 667 },
    { "T", 611 },
    { "U", 722 },
    { "V", 667 },
    { "W", 944 },
    { "X", 667 },
    { "Y", 667 },
    { "Z", 611 },
    { "a", 556 },
    { "ampersand", 667 },
    { "asciicircum", 469 },
    { "asciitilde", 584 },
    { "asterisk", 389 },
    { "at", 1015 },
    { "b", 556 },
    { "backslash", 278 },
    { "bar", 260 },
    { "braceleft", 334 },
    { "braceright", 334 },
    { "bracketleft", 278 },
    { "bracketright", 278 },
    { "bullet", 350 },
    { "c", 500 },
    { "colon", 278 },
    { "comma", 278 },
    { "d", 556 },
    { "dollar", 556 },
    { "e", 556 },
    { "eight", 556 },
    { "ellipsis", 1000 },
    { "emdash", 1000 },
    { "endash", 556 },
    { "equal", 584 },
    { "exclam", 278 },
    { "f", 278 },
    { "fi", 500 },
    { "five", 556 },
    { "fl", 500 },
    { "four", 556 },
    { "g", 556 },
    { "grave", 333 },
    { "greater", 584 },
    { "h", 556 },
    { "hyphen", 333 },
    { "i", 222 },
    { "j", 222 },
    { "k", 500 },
    { "l", 222 },
    { "less", 584 },
    { "m", 833 },
    { "n", 556 },
    { "nine", 556 },
    { "numbersign", 556 },
    { "o", 556 },
    { "one", 556 },
    { "p", 556 },
    { "parenleft", 333 },
    { "parenright", 333 },
    { "percent", 889 },
    { "period", 278 },
    { "plus", 584 },
    { "q", 556 },
    { "question", 556 },
    { "quotedbl", 355 },
    { "quotedblleft", 333 },
    { "quotedblright", 333 },
    { "quoteleft", 222 },
    { "quoteright", 222 },
    { "quotesingle", 191 },
    { "r", 333 },
    { "s", 500 },
    { "semicolon", 278 },
    { "seven", 556 },
    { "six", 556 },
    { "slash", 278 },
    { "space", 278 },
    { "t", 278 },
    { "three", 556 },
    { "two", 556 },
    { "u", 556 },
    { "underscore", 556 },
    { "v", 500 },
    { "w", 722 },
    { "x", 500 },
    { "y", 500 },
    { "z", 500 },
    { "zero", 556 }
};

static const glyph_width_t times_roman_widths [] = {
    { "A", 722 },
    { "B", 667 },
    { "C", 667 },
    { "D", 722 },
    { "E", 611 },
    { "F", 556 },
    { "G", 722 },
    { "H", 722 },
    { "I", 333 },
    { "J", 389 },
    { "K", 722 },
    { "L", 611 },
    { "M", 889 },
    { "N", 722 },
    { "O", 722 },
    { "P", 556 },
    { "Q", 722 },
    { "R", 667 },
    { "S", 556 },
    { "T", 611 },
    { "U", 722 },
    { "V", 722 },
    { "W", 944 },
    { "X", 722 },
    { "Y", 722 },
    { "Z", 611 },
    { "a", 444 },
    { "ampersand", 778 },
    { "asciicircum", 469 },
    { "asciitilde", 541 },
    { "asterisk", 500 },
    { "at", 921 },
    { "b", 500 },
    { "backslash", 278 },
    { "bar", 200 },
    { "braceleft", 480 },
    { "braceright", 480 },
    { "bracketleft", 333 },
    { "bracketright", 333 },
    { "bullet", 350 },
    { "c", 444 },
    { "colon", 278 },
    { "comma", 250 },
    { "d", 500 },
    { "dollar", 500 },
    { "e", 444 },
    { "eight", 500 },
    { "ellipsis", 1000 },
    { "emdash", 1000 },
    { "endash", 500 },
    { "equal", 564 },
    { "exclam", 333 },
    { "f", 333 },
    { "fi", 556 },
    { "five", 500 },
    { "fl", 556 },
    { "four", 500 },
    { "g", 500 },
    { "grave", 333 },
    { "greater", 564 },
    { "h", 500 },
    { "hyphen", 333 },
    { "i", 278 },
    { "j", 278 },
    { "k", 500 },
    { "l", 278 },
    { "less", 564 },
    { "m", 778 },
    { "n", 500 },
    { "nine", 500 },
    { "numbersign", 500 },
    { "o", 500 },
    { "one", 500 },
    { "p", 500 },
    { "parenleft", 333 },
    { "parenright", 333 },
    { "percent", 833 },
    { "period", 250 },
    { "plus", 564 },
    { "q", 500 },
    { "question", 444 },
    { "quotedbl", 408 },
    { "quotedblleft", 444 },
    { "quotedblright", 444 },
    { "quoteleft", 333 },
    { "quoteright", 333 },
    { "quotesingle", 180 },
    { "r", 333 },
    { "s", 389 },
    { "semicolon", 278 },
    { "seven", 500 },
    { "six", 500 },
    { "slash", 278 },
    { "space", 250 },
    { "t", 278 },
    { "three", 500 },
    { "two", 500 },
    { "u", 500 },
    { "underscore", 500 },
    { "v", 500 },
    { "w", 722 },
    { "x", 500 },
    { "y", 500 },
    { "z", 444 },
    { "zero", 500 }
};

static const builtin_font_t builtin_fonts [] = {
    {
        "Helvetica", helvetica_widths,
        sizeof helvetica_widths / sizeof *helvetica_widths, 556, 718, -207
    },
    {
        "Times", times_roman_widths,
        sizeof times_roman_widths / sizeof *times_roman_widths, 500, 683, -217
    },
    { "Courier",      0, 0, 600, 629, -157 },
    { "Symbol",       0, 0, 500, 1010, -293 },
    { "ZapfDingbats", 0, 0, 800, 820, -143 }
};

//
// Common substitutes of the standard fonts:
//
static const char* builtin_font_aliases [][2] = {
    { "Arial",           "Helvetica" },
    { "ArialMT",         "Helvetica" },
    { "Helvetica",       "Helvetica" },
    { "TimesNewRoman",   "Times"     },
    { "TimesNewRomanPS", "Times"     },
    { "Times",           "Times"     },
    { "CourierNew",      "Courier"   },
    { "CourierNewPS",    "Courier"   },
    { "Courier",         "Courier"   },
    { "Symbol",          "Symbol"    },
    { "ZapfDingbats",    "ZapfDingbats" }
};

const builtin_font_t* find_builtin_font (const char* s) {
    std::string name (s);

    //
    // Subset prefix, e.g., `ABCDEF+Helvetica':
    //
    if (name.size () > 7 && name [6] == '+') {
        name = name.substr (7);
    }

    name = name.substr (0, name.find_first_of (",-"));

    //
    // `Times-Roman' splits into `Times', `TimesNewRomanPSMT' keeps the
    // `PS' prefix:
    //
    if (name.size () > 2 && 0 == name.compare (name.size () - 2, 2, "MT")) {
        name.resize (name.size () - 2);
    }

    for (const auto& [alias, family] : builtin_font_aliases) {
        if (name == alias) {
            for (const auto& font : builtin_fonts) {
                if (0 == strcmp (font.name, family)) {
                    return &font;
                }
            }
        }
    }

    return 0;
}

int builtin_width (const builtin_font_t& font, const char* glyph) {
    if (0 == font.widths || 0 == glyph) {
        return font.default_width;
    }

    const auto first = font.widths, last = font.widths + font.size;

    auto iter = std::lower_bound (
        first, last, glyph, [](const glyph_width_t& lhs, const char* rhs) {
            return strcmp (lhs.name, rhs) < 0;
        });

    return iter != last && 0 == strcmp (iter->name, glyph)
        ? iter->width : font.default_width;
}

char32_t glyph_unicode (const char* glyph) {
    if (0 == glyph || 0 == glyph [0]) {
        return 0;
    }

    const auto first = glyph_unicode_table;
    const auto last = glyph_unicode_table + glyph_unicode_table_size;

    auto iter = std::lower_bound (
        first, last, glyph, [](const glyph_unicode_t& lhs, const char* rhs) {
            return strcmp (lhs.name, rhs) < 0;
        });

    if (iter != last && 0 == strcmp (iter->name, glyph)) {
        return iter->unicode;
    }

    auto hex = [](const char* s, size_t n) -> char32_t {
        if (strlen (s) != n) {
            return 0;
        }

        for (size_t i = 0; i < n; ++i) {
            if (!std::isxdigit ((unsigned char)s [i])) {
                return 0;
            }
        }

        return char32_t (strtoul (s, 0, 16));
    };

    if (0 == strncmp (glyph, "uni", 3)) {
        return hex (glyph + 3, 4);
    }
    else if (glyph [0] == 'u') {
        if (auto c = hex (glyph + 1, 4)) {
            return c;
        }

        if (auto c = hex (glyph + 1, 5)) {
            return c;
        }

        return hex (glyph + 1, 6);
    }

    //
    // Suffixed variants, e.g., `a.sc' or `f_i':
    //
    if (auto p = strchr (glyph, '.')) {
        if (p != glyph) {
            return glyph_unicode (std::string (glyph, p).c_str ());
        }
    }

    return 0;
}

const char* glyph_name (char32_t c) {
    for (size_t i = 0; i < glyph_unicode_table_size; ++i) {
        if (glyph_unicode_table [i].unicode == c) {
            return glyph_unicode_table [i].name;
        }
    }

    return 0;
}

} // namespace scrub
