#include "studio/studio_api.hpp"

namespace studio_api {

const char *track_type_name(TrackType type) {
    switch (type) {
    case TrackType::Video:
        return "video";
    case TrackType::Audio:
        return "audio";
    case TrackType::Subtitle:
        return "subtitle";
    }
    return "video";
}

} // namespace studio_api
