#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "kiosk/composite_source.hpp"
#include "kiosk/http_client.hpp"

namespace kiosk {

class ConfigManager;

//! Upstream endpoints for the crypto screen
struct CryptoEndpoints {
	std::string price_url;
	std::string fees_url;
	std::string difficulty_url;
	std::string hashrate_url;
	std::string blocks_url;
	std::string mempool_url;
	//! Number of recent blocks kept in the payload
	int64_t recent_blocks = 3;

	//! CoinGecko for the price, mempool.space for everything else
	static CryptoEndpoints Defaults();
	static CryptoEndpoints FromConfig(const ConfigManager &config);
};

//! Bitcoin price and network statistics, assembled from six independent requests.
//!
//! Section defaults when a request fails:
//!   price      -> price 0, price_change_24h 0, price_formatted "$0.00"
//!   fees       -> fee_fastest, fee_half_hour, fee_hour, fee_economy, fee_minimum 0
//!   difficulty -> difficulty_progress, difficulty_change, difficulty_remaining_blocks, difficulty_retarget_time 0
//!   hashrate   -> hashrate_ehs 0, difficulty 0
//!   blocks     -> block_height 0, block_hash "", block_hash_short "", block_time 0, blocks []
//!   mempool    -> mempool_tx_count, mempool_vsize, mempool_total_fee 0
class CryptoSource : public CompositeSource {
public:
	static constexpr const char *KEY = "crypto";

	CryptoSource(std::shared_ptr<ResultCache> cache, std::shared_ptr<HttpClient> http, CryptoEndpoints endpoints,
	             std::chrono::milliseconds refresh_interval);

	//! Price in USD, 0 if unavailable
	double GetPrice();
	std::string GetFormattedPrice();
	int64_t GetBlockHeight();

	const CryptoEndpoints &Endpoints() const {
		return endpoints_;
	}

private:
	void FetchPrice(PayloadBuilder &out);
	void FetchFees(PayloadBuilder &out);
	void FetchDifficulty(PayloadBuilder &out);
	void FetchHashrate(PayloadBuilder &out);
	void FetchBlocks(PayloadBuilder &out);
	void FetchMempool(PayloadBuilder &out);

	static void DefaultPrice(PayloadBuilder &out);
	static void DefaultFees(PayloadBuilder &out);
	static void DefaultDifficulty(PayloadBuilder &out);
	static void DefaultHashrate(PayloadBuilder &out);
	static void DefaultBlocks(PayloadBuilder &out);
	static void DefaultMempool(PayloadBuilder &out);

	std::shared_ptr<HttpClient> http_;
	CryptoEndpoints endpoints_;
};

} // namespace kiosk
