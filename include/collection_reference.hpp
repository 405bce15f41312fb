#pragma once
#include <string>
#include <utility>
#include <variant>

struct SingleSermon { std::string id; };
struct Speaker { std::string id; };
struct Broadcaster { std::string id; };
struct Series { std::string id; };

// What one invocation downloads. Built once from user input, then read-only.
class CollectionReference {
public:
    using Target = std::variant<SingleSermon, Speaker, Broadcaster, Series>;

    explicit CollectionReference(Target target) : target_(std::move(target)) {}

    // Each accepts a bare identifier or a full sermonaudio.com URL and throws
    // InvalidReferenceError when no identifier can be extracted.
    static CollectionReference sermon(const std::string& input);
    static CollectionReference speaker(const std::string& input);
    static CollectionReference broadcaster(const std::string& input);
    static CollectionReference series(const std::string& input);

    const Target& target() const { return target_; }
    const std::string& id() const;
    const char* kindName() const;
    bool isSingle() const { return std::holds_alternative<SingleSermon>(target_); }

    // Listing filter parameter name (speakerID, broadcasterID, seriesID).
    const char* listingParameter() const;

    // Path segment of the collection's page on the website.
    const char* webPath() const;

private:
    Target target_;
};
