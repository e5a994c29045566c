#pragma once

#include <cstdint>
#include <istream>
#include <string>
#include <vector>

#include <chartgeom/Utils.hpp>
#include <chartgeom/Series.hpp>

/*
    <TICKER>;<PER>;<DATE>;<TIME>;<OPEN>;<HIGH>;<LOW>;<CLOSE>;<VOL>
    SPFB.RTS;60;01/15/19;10:00:00;112500;113120;112310;112950;18234
    DATE is mm/dd/yy, an empty price is a missing sample
*/
constexpr size_t BAR_FIELDS = 9;

std::vector<std::string> parse_line(const std::string &line, const std::string &del);

/* empty is a missing sample, nan/inf and trailing characters throw */
chartgeom::Sample parse_price(const std::string &token);
/* empty is 0, a leading minus or trailing characters throw */
uint64_t parse_volume(const std::string &token);
chartgeom::Result parse_bar(const std::string &line, chartgeom::Bar &bar);

/* skips the header line, malformed lines are logged and dropped */
chartgeom::PriceFrame read_frame(std::istream &in, const std::string &ticker);
chartgeom::PriceFrame load_frame(const std::string &file);
std::vector<chartgeom::PriceFrame> load_frames(const std::vector<std::string> &files);
