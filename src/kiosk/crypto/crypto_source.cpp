#include "crypto_source.hpp"

#include "kiosk/config.hpp"
#include "kiosk/exception.hpp"
#include "kiosk/string_util.hpp"

#include <algorithm>

namespace kiosk {

constexpr const char *CryptoSource::KEY;

static double RequireNumber(const Payload &doc, const std::string &path, const char *section) {
	auto val = doc.Get(path);
	if (!yyjson_is_num(val)) {
		throw PayloadException(std::string(section) + " response has no numeric '" + path + "'");
	}
	return doc.GetDouble(path);
}

static std::string ShortHash(const std::string &hash) {
	if (hash.size() <= 16) {
		return hash;
	}
	return hash.substr(0, 16) + "...";
}

//======================================================================================================================
// CryptoEndpoints
//======================================================================================================================

CryptoEndpoints CryptoEndpoints::Defaults() {
	CryptoEndpoints endpoints;
	endpoints.price_url =
	    "https://api.coingecko.com/api/v3/simple/price?ids=bitcoin&vs_currencies=usd&include_24hr_change=true";
	endpoints.fees_url = "https://mempool.space/api/v1/fees/recommended";
	endpoints.difficulty_url = "https://mempool.space/api/v1/difficulty-adjustment";
	endpoints.hashrate_url = "https://mempool.space/api/v1/mining/hashrate/3d";
	endpoints.blocks_url = "https://mempool.space/api/v1/blocks";
	endpoints.mempool_url = "https://mempool.space/api/mempool";
	endpoints.recent_blocks = 3;
	return endpoints;
}

CryptoEndpoints CryptoEndpoints::FromConfig(const ConfigManager &config) {
	auto defaults = Defaults();
	CryptoEndpoints endpoints;
	endpoints.price_url = config.GetString("crypto.price_url", defaults.price_url);
	endpoints.fees_url = config.GetString("crypto.fees_url", defaults.fees_url);
	endpoints.difficulty_url = config.GetString("crypto.difficulty_url", defaults.difficulty_url);
	endpoints.hashrate_url = config.GetString("crypto.hashrate_url", defaults.hashrate_url);
	endpoints.blocks_url = config.GetString("crypto.blocks_url", defaults.blocks_url);
	endpoints.mempool_url = config.GetString("crypto.mempool_url", defaults.mempool_url);
	endpoints.recent_blocks = config.GetInt("crypto.recent_blocks", defaults.recent_blocks);
	if (endpoints.recent_blocks < 1) {
		endpoints.recent_blocks = 1;
	}
	return endpoints;
}

//======================================================================================================================
// CryptoSource
//======================================================================================================================

CryptoSource::CryptoSource(std::shared_ptr<ResultCache> cache, std::shared_ptr<HttpClient> http,
                           CryptoEndpoints endpoints, std::chrono::milliseconds refresh_interval)
    : CompositeSource(KEY, std::move(cache), refresh_interval), http_(std::move(http)),
      endpoints_(std::move(endpoints)) {
	if (!http_) {
		throw InvalidInputException("crypto source needs an HTTP client");
	}
	AddSection("price", [this](PayloadBuilder &out) { FetchPrice(out); }, DefaultPrice);
	AddSection("fees", [this](PayloadBuilder &out) { FetchFees(out); }, DefaultFees);
	AddSection("difficulty", [this](PayloadBuilder &out) { FetchDifficulty(out); }, DefaultDifficulty);
	AddSection("hashrate", [this](PayloadBuilder &out) { FetchHashrate(out); }, DefaultHashrate);
	AddSection("blocks", [this](PayloadBuilder &out) { FetchBlocks(out); }, DefaultBlocks);
	AddSection("mempool", [this](PayloadBuilder &out) { FetchMempool(out); }, DefaultMempool);
}

double CryptoSource::GetPrice() {
	return GetData().payload.GetDouble("price", 0);
}

std::string CryptoSource::GetFormattedPrice() {
	return GetData().payload.GetString("price_formatted", "$0.00");
}

int64_t CryptoSource::GetBlockHeight() {
	return GetData().payload.GetInt("block_height", 0);
}

//------------------------------------------------------------------------------------------------------------------
// Sections
//------------------------------------------------------------------------------------------------------------------

// {"bitcoin": {"usd": 67012.5, "usd_24h_change": -1.23}}
void CryptoSource::FetchPrice(PayloadBuilder &out) {
	auto doc = http_->GetJson(endpoints_.price_url);
	auto price = RequireNumber(doc, "bitcoin.usd", "price");
	out.AddDouble("price", price);
	out.AddDouble("price_change_24h", doc.GetDouble("bitcoin.usd_24h_change", 0));
	out.AddString("price_formatted", "$" + StringUtil::FormatThousands(price, 2));
}

// {"fastestFee": 12, "halfHourFee": 10, "hourFee": 8, "economyFee": 4, "minimumFee": 2}
void CryptoSource::FetchFees(PayloadBuilder &out) {
	auto doc = http_->GetJson(endpoints_.fees_url);
	out.AddDouble("fee_fastest", RequireNumber(doc, "fastestFee", "fees"));
	out.AddDouble("fee_half_hour", doc.GetDouble("halfHourFee", 0));
	out.AddDouble("fee_hour", doc.GetDouble("hourFee", 0));
	out.AddDouble("fee_economy", doc.GetDouble("economyFee", 0));
	out.AddDouble("fee_minimum", doc.GetDouble("minimumFee", 0));
}

// {"progressPercent": 41.2, "difficultyChange": 2.1, "remainingBlocks": 1185, "estimatedRetargetDate": <ms>}
void CryptoSource::FetchDifficulty(PayloadBuilder &out) {
	auto doc = http_->GetJson(endpoints_.difficulty_url);
	out.AddDouble("difficulty_progress", RequireNumber(doc, "progressPercent", "difficulty"));
	out.AddDouble("difficulty_change", doc.GetDouble("difficultyChange", 0));
	out.AddInt("difficulty_remaining_blocks", doc.GetInt("remainingBlocks", 0));
	out.AddInt("difficulty_retarget_time", doc.GetInt("estimatedRetargetDate", 0) / 1000);
}

// {"currentHashrate": 6.1e20, "currentDifficulty": 8.3e13, ...}
void CryptoSource::FetchHashrate(PayloadBuilder &out) {
	auto doc = http_->GetJson(endpoints_.hashrate_url);
	out.AddDouble("hashrate_ehs", RequireNumber(doc, "currentHashrate", "hashrate") / 1e18);
	out.AddDouble("difficulty", doc.GetDouble("currentDifficulty", 0));
}

// [{"id": "<hash>", "height": 840000, "timestamp": 1713571767, "tx_count": 3050, "size": 2325617}, ...]
void CryptoSource::FetchBlocks(PayloadBuilder &out) {
	auto doc = http_->GetJson(endpoints_.blocks_url);
	auto root = doc.Root();
	if (!yyjson_is_arr(root) || yyjson_arr_size(root) == 0) {
		throw PayloadException("blocks response is not a non-empty array");
	}
	auto height = RequireNumber(doc, "0.height", "blocks");
	auto hash = doc.GetString("0.id");

	out.AddInt("block_height", static_cast<int64_t>(height));
	out.AddString("block_hash", hash);
	out.AddString("block_hash_short", ShortHash(hash));
	out.AddInt("block_time", doc.GetInt("0.timestamp", 0));

	auto blocks = yyjson_mut_arr(out.Doc());
	auto count = std::min<size_t>(yyjson_arr_size(root), static_cast<size_t>(endpoints_.recent_blocks));
	for (size_t i = 0; i < count; i++) {
		auto prefix = std::to_string(i) + ".";
		auto block = yyjson_mut_obj(out.Doc());
		yyjson_mut_obj_add_int(out.Doc(), block, "height", doc.GetInt(prefix + "height", 0));
		yyjson_mut_obj_add_int(out.Doc(), block, "tx_count", doc.GetInt(prefix + "tx_count", 0));
		yyjson_mut_obj_add_int(out.Doc(), block, "timestamp", doc.GetInt(prefix + "timestamp", 0));
		yyjson_mut_obj_add_int(out.Doc(), block, "size", doc.GetInt(prefix + "size", 0));
		yyjson_mut_arr_append(blocks, block);
	}
	out.AddValue("blocks", blocks);
}

// {"count": 41234, "vsize": 21873912, "total_fee": 52311234, "fee_histogram": [...]}
void CryptoSource::FetchMempool(PayloadBuilder &out) {
	auto doc = http_->GetJson(endpoints_.mempool_url);
	out.AddInt("mempool_tx_count", static_cast<int64_t>(RequireNumber(doc, "count", "mempool")));
	out.AddInt("mempool_vsize", doc.GetInt("vsize", 0));
	out.AddInt("mempool_total_fee", doc.GetInt("total_fee", 0));
}

//------------------------------------------------------------------------------------------------------------------
// Defaults
//------------------------------------------------------------------------------------------------------------------

void CryptoSource::DefaultPrice(PayloadBuilder &out) {
	out.AddDouble("price", 0);
	out.AddDouble("price_change_24h", 0);
	out.AddString("price_formatted", "$0.00");
}

void CryptoSource::DefaultFees(PayloadBuilder &out) {
	out.AddDouble("fee_fastest", 0);
	out.AddDouble("fee_half_hour", 0);
	out.AddDouble("fee_hour", 0);
	out.AddDouble("fee_economy", 0);
	out.AddDouble("fee_minimum", 0);
}

void CryptoSource::DefaultDifficulty(PayloadBuilder &out) {
	out.AddDouble("difficulty_progress", 0);
	out.AddDouble("difficulty_change", 0);
	out.AddInt("difficulty_remaining_blocks", 0);
	out.AddInt("difficulty_retarget_time", 0);
}

void CryptoSource::DefaultHashrate(PayloadBuilder &out) {
	out.AddDouble("hashrate_ehs", 0);
	out.AddDouble("difficulty", 0);
}

void CryptoSource::DefaultBlocks(PayloadBuilder &out) {
	out.AddInt("block_height", 0);
	out.AddString("block_hash", "");
	out.AddString("block_hash_short", "");
	out.AddInt("block_time", 0);
	out.AddValue("blocks", yyjson_mut_arr(out.Doc()));
}

void CryptoSource::DefaultMempool(PayloadBuilder &out) {
	out.AddInt("mempool_tx_count", 0);
	out.AddInt("mempool_vsize", 0);
	out.AddInt("mempool_total_fee", 0);
}

} // namespace kiosk
