#include "StationClient.h"

const char* FetchResultName(FetchResult result) {
    switch (result) {
        case FetchResult::Ok:               return "Ok";
        case FetchResult::NetworkError:     return "NetworkError";
        case FetchResult::ParseError:       return "ParseError";
        case FetchResult::InsufficientData: return "InsufficientData";
    }
    return "?";
}
