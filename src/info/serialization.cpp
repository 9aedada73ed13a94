#include <nlohmann/json.hpp>
#include <ytpipe/info_service.hpp>

namespace ytpipe {

namespace {

std::string_view delivery_name(DeliveryKind kind) {
	switch (kind) {
		case DeliveryKind::stream: return "stream";
		case DeliveryKind::single_file: return "single_file";
		case DeliveryKind::archive: return "archive";
	}
	return "stream";
}

}  // namespace

void to_json(nlohmann::json &j, const FormatVariant &f) {
	j = nlohmann::json{
		{"formatId", f.format_id},
		{"extension", f.extension},
		{"quality", f.quality},
		{"qualityLabel", f.quality_label},
		{"hasAudio", f.has_audio},
		{"hasVideo", f.has_video},
		{"filesize", f.filesize},
		{"audioChannels", f.audio_channels}};

	if (f.is_placeholder()) j["placeholder"] = true;
}

void to_json(nlohmann::json &j, const CaptionTrack &c) {
	j = nlohmann::json{{"lang", c.lang}, {"name", c.name}};
}

void to_json(nlohmann::json &j, const CollectionMember &m) {
	j = nlohmann::json{
		{"id", m.id},
		{"title", m.title},
		{"duration", m.duration},
		{"thumbnailUrl", m.thumbnail},
		{"position", m.position}};
}

void to_json(nlohmann::json &j, const ResourceInfo &i) {
	j = nlohmann::json{
		{"id", i.id},
		{"title", i.title},
		{"description", i.description},
		{"thumbnailUrl", i.thumbnail},
		{"duration", i.duration},
		{"channel", i.channel},
		{"formats", i.formats},
		{"subtitles", i.captions}};

	// Optional fields are left out rather than written as null
	if (i.is_collection) j["isPlaylist"] = *i.is_collection;
	if (i.collection_members) j["playlistItems"] = *i.collection_members;
}

void to_json(nlohmann::json &j, const CollectionInfo &c) {
	j = nlohmann::json{
		{"id", c.id},
		{"title", c.title},
		{"description", c.description},
		{"thumbnailUrl", c.thumbnail},
		{"channelTitle", c.channel},
		{"videoCount", c.members.size()},
		{"videos", c.members}};
}

void to_json(nlohmann::json &j, const ProgressEvent &e) {
	j = nlohmann::json{
		{"progress", e.percent},
		{"speed", e.rate},
		{"eta", e.eta},
		{"strategy", e.strategy}};
}

void to_json(nlohmann::json &j, const DownloadSummary &s) {
	j = nlohmann::json{
		{"strategy", s.strategy},
		{"bytes", s.bytes},
		{"delivery", delivery_name(s.delivery)},
		{"fileName", s.file_name}};
}

}  // namespace ytpipe
