#pragma once

#include <ytpipe/ytpipe_export.h>

#include <boost/asio/any_completion_executor.hpp>
#include <boost/asio/any_completion_handler.hpp>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/associated_executor.hpp>
#include <boost/asio/async_result.hpp>
#include <memory>
#include <nlohmann/json_fwd.hpp>
#include <string>
#include <string_view>
#include <vector>
#include <ytpipe/cancellation.hpp>
#include <ytpipe/config.hpp>
#include <ytpipe/process_runner.hpp>
#include <ytpipe/result.hpp>
#include <ytpipe/ttl_cache.hpp>
#include <ytpipe/types.hpp>

namespace ytpipe {

namespace asio = boost::asio;

/// Resource metadata through the acquisition tool, cached per resource.
class YTPIPE_EXPORT InfoService {
   public:
	InfoService(const InfoService &) = delete;
	InfoService &operator=(const InfoService &) = delete;
	~InfoService();

	InfoService(asio::any_io_executor ex, std::shared_ptr<ProcessRunner> runner,
				PipelineConfig config);

	[[nodiscard]] asio::any_io_executor get_executor() const;

	using CompletionExecutor = asio::any_completion_executor;

	/// `ref` is a bare id or a locator. A locator carrying `list=` yields
	/// is_collection = true and the ordered members; if the collection cannot
	/// be fetched the single item is returned instead. Cancelling `cancel`
	/// stops the running tool call and skips the remaining ones.
	template <BOOST_ASIO_COMPLETION_TOKEN_FOR(void(Result<ResourceInfo>))
				  CompletionToken>
	auto async_fetch_info(std::string ref, CancelToken cancel,
						  CompletionToken &&token) {
		auto ex = get_executor();
		return asio::async_initiate<CompletionToken, void(Result<ResourceInfo>)>(
			[this, ex, ref = std::move(ref),
			 cancel = std::move(cancel)](auto &&handler) mutable {
				CompletionExecutor handler_ex =
					asio::get_associated_executor(handler, ex);

				auto any_handler =
					asio::any_completion_handler<void(Result<ResourceInfo>)>{
						std::forward<decltype(handler)>(handler)};

				fetch_info_impl(std::move(ref), std::move(cancel),
								std::move(any_handler), std::move(handler_ex));
			},
			token);
	}

	template <BOOST_ASIO_COMPLETION_TOKEN_FOR(void(Result<ResourceInfo>))
				  CompletionToken>
	auto async_fetch_info(std::string ref, CompletionToken &&token) {
		return async_fetch_info(std::move(ref), CancelToken{},
								std::forward<CompletionToken>(token));
	}

	template <BOOST_ASIO_COMPLETION_TOKEN_FOR(void(Result<CollectionInfo>))
				  CompletionToken>
	auto async_fetch_collection_info(std::string collection_id,
									 CancelToken cancel,
									 CompletionToken &&token) {
		auto ex = get_executor();
		return asio::async_initiate<CompletionToken,
									void(Result<CollectionInfo>)>(
			[this, ex, id = std::move(collection_id),
			 cancel = std::move(cancel)](auto &&handler) mutable {
				CompletionExecutor handler_ex =
					asio::get_associated_executor(handler, ex);

				auto any_handler =
					asio::any_completion_handler<void(Result<CollectionInfo>)>{
						std::forward<decltype(handler)>(handler)};

				fetch_collection_impl(std::move(id), std::move(cancel),
									  std::move(any_handler),
									  std::move(handler_ex));
			},
			token);
	}

	template <BOOST_ASIO_COMPLETION_TOKEN_FOR(void(Result<CollectionInfo>))
				  CompletionToken>
	auto async_fetch_collection_info(std::string collection_id,
									 CompletionToken &&token) {
		return async_fetch_collection_info(
			std::move(collection_id), CancelToken{},
			std::forward<CompletionToken>(token));
	}

	/// Raw rows of the tool's `--list-formats` table.
	template <BOOST_ASIO_COMPLETION_TOKEN_FOR(
		void(Result<std::vector<std::string>>)) CompletionToken>
	auto async_list_formats(std::string ref, CompletionToken &&token) {
		auto ex = get_executor();
		return asio::async_initiate<CompletionToken,
									void(Result<std::vector<std::string>>)>(
			[this, ex, ref = std::move(ref)](auto &&handler) mutable {
				CompletionExecutor handler_ex =
					asio::get_associated_executor(handler, ex);

				auto any_handler = asio::any_completion_handler<void(
					Result<std::vector<std::string>>)>{
					std::forward<decltype(handler)>(handler)};

				list_formats_impl(std::move(ref), std::move(any_handler),
								  std::move(handler_ex));
			},
			token);
	}

	void clear_caches();

	[[nodiscard]] MetadataCache &metadata_cache();
	[[nodiscard]] FormatListCache &format_cache();

   private:
	struct Impl;
	std::shared_ptr<Impl> impl_;

	void fetch_info_impl(
		std::string ref, CancelToken cancel,
		asio::any_completion_handler<void(Result<ResourceInfo>)> handler,
		CompletionExecutor handler_ex);

	void fetch_collection_impl(
		std::string collection_id, CancelToken cancel,
		asio::any_completion_handler<void(Result<CollectionInfo>)> handler,
		CompletionExecutor handler_ex);

	void list_formats_impl(
		std::string ref,
		asio::any_completion_handler<void(Result<std::vector<std::string>>)>
			handler,
		CompletionExecutor handler_ex);
};

/// Display name for a caption language code ("en" -> "English").
YTPIPE_EXPORT std::string caption_language_name(std::string_view code);

/// Builds ResourceInfo fields from one metadata dump, without formats.
YTPIPE_EXPORT ResourceInfo parse_resource_dump(const nlohmann::json &dump);

// JSON Serialization
YTPIPE_EXPORT void to_json(nlohmann::json &j, const FormatVariant &f);
YTPIPE_EXPORT void to_json(nlohmann::json &j, const CaptionTrack &c);
YTPIPE_EXPORT void to_json(nlohmann::json &j, const CollectionMember &m);
YTPIPE_EXPORT void to_json(nlohmann::json &j, const ResourceInfo &i);
YTPIPE_EXPORT void to_json(nlohmann::json &j, const CollectionInfo &c);
YTPIPE_EXPORT void to_json(nlohmann::json &j, const ProgressEvent &e);
YTPIPE_EXPORT void to_json(nlohmann::json &j, const DownloadSummary &s);

}  // namespace ytpipe
