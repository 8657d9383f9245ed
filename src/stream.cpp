/**
 * @file stream.cpp
 * @brief Chunk stream and container encoder implementation.
 */

#include <ubjson/primitives.hpp>
#include <ubjson/stream.hpp>

#include <utility>

namespace ubjson {

ChunkStream::ChunkStream(std::shared_ptr<const HandlerRegistry> registry, const Value& root)
    : registry_(std::move(registry)) {
    frames_.push_back(Frame{FrameKind::Pending, ValueRef{&root, nullptr}});
}

ChunkStream::ChunkStream(std::shared_ptr<const HandlerRegistry> registry, Value&& root)
    : registry_(std::move(registry)) {
    auto owned = std::make_shared<const Value>(std::move(root));
    const Value* pointer = owned.get();
    frames_.push_back(Frame{FrameKind::Pending, ValueRef{pointer, std::move(owned)}});
}

bool ChunkStream::next(Chunk& chunk) {
    chunk.clear();
    if (error_ != Error::Ok) {
        return false;
    }

    buffer_.clear();
    try {
        while (buffer_.empty() && !frames_.empty()) {
            if (step() != Error::Ok) {
                return false;
            }
        }
    } catch (...) {
        // A throwing handler or producer leaves the frame stack mid-container
        fail(Error::InvalidArg, "encoding aborted by an exception");
        throw;
    }

    if (buffer_.empty()) {
        return false;
    }

    bytes_produced_ += buffer_.size();
    buffer_.swap(chunk);
    return true;
}

Error ChunkStream::fail(Error error, std::string detail) {
    error_ = error;
    error_detail_ = std::move(detail);
    frames_.clear();
    buffer_.clear();
    return error;
}

Error ChunkStream::step() {
    Frame& top = frames_.back();
    switch (top.kind) {
    case FrameKind::Pending: {
        ValueRef ref = std::move(top.ref);
        frames_.pop_back();
        return start_value(std::move(ref));
    }
    case FrameKind::SizedArray:
        return step_sized_array(top);
    case FrameKind::UnsizedArray:
        return step_unsized_array(top);
    case FrameKind::SizedObject:
        return step_sized_object(top);
    case FrameKind::UnsizedObject:
        return step_unsized_object(top);
    }
    return fail(Error::InvalidArg, "corrupted encoder state");
}

Error ChunkStream::start_value(ValueRef ref) {
    Resolution resolution = registry_->resolve(*ref.value);

    switch (resolution.route) {
    case Route::Noop:
        encode_noop(buffer_);
        return Error::Ok;

    case Route::Native:
        return encode_native(std::move(ref));

    case Route::Adapt: {
        auto adapted = std::make_shared<const Value>((*resolution.handler)(*ref.value));
        if (adapted->is_noop()) {
            encode_noop(buffer_);
            return Error::Ok;
        }
        const Value* pointer = adapted.get();
        return encode_native(ValueRef{pointer, std::move(adapted)});
    }

    case Route::Unsupported:
    default:
        return fail(Error::UnsupportedType,
                    "Unable to encode " + ref.value->describe() + " to ubjson");
    }
}

Error ChunkStream::encode_native(ValueRef ref) {
    const Value& value = *ref.value;

    switch (value.type()) {
    case Type::Noop:
        encode_noop(buffer_);
        return Error::Ok;

    case Type::Null:
        encode_null(buffer_);
        return Error::Ok;

    case Type::Bool:
        encode_bool(buffer_, *value.get_if<bool>());
        return Error::Ok;

    case Type::Integer:
        if (encode_integer(buffer_, *value.get_if<Integer>()) != Error::Ok) {
            return fail(Error::InvalidArg, "integer too long to encode");
        }
        return Error::Ok;

    case Type::Float:
        if (encode_float(buffer_, *value.get_if<double>()) != Error::Ok) {
            return fail(Error::InvalidArg, "float text too long to encode");
        }
        return Error::Ok;

    case Type::HugeNumber: {
        const auto& huge = *value.get_if<HugeNumber>();
        if (encode_huge(buffer_, huge.text) != Error::Ok) {
            return fail(Error::InvalidArg, "huge number text too long to encode");
        }
        return Error::Ok;
    }

    case Type::String:
        if (encode_string(buffer_, *value.get_if<std::string>()) != Error::Ok) {
            return fail(Error::InvalidArg, "string too long to encode: " + value.describe());
        }
        return Error::Ok;

    case Type::Array: {
        const auto& items = *value.get_if<Array>();
        if (encode_length(buffer_, marker::ARRAY_SHORT, marker::ARRAY_LONG, items.size()) !=
            Error::Ok) {
            return fail(Error::InvalidArg, "too many elements to encode: " + value.describe());
        }
        frames_.push_back(Frame{FrameKind::SizedArray, std::move(ref)});
        return Error::Ok;
    }

    case Type::UnsizedArray:
        buffer_.append_byte(marker::ARRAY_SHORT);
        buffer_.append_byte(marker::UNKNOWN_LENGTH);
        frames_.push_back(Frame{FrameKind::UnsizedArray, std::move(ref)});
        return Error::Ok;

    case Type::Object: {
        const auto& members = *value.get_if<Object>();
        if (encode_length(buffer_, marker::OBJECT_SHORT, marker::OBJECT_LONG, members.size()) !=
            Error::Ok) {
            return fail(Error::InvalidArg, "too many members to encode: " + value.describe());
        }
        frames_.push_back(Frame{FrameKind::SizedObject, std::move(ref)});
        return Error::Ok;
    }

    case Type::UnsizedObject:
        buffer_.append_byte(marker::OBJECT_SHORT);
        buffer_.append_byte(marker::UNKNOWN_LENGTH);
        frames_.push_back(Frame{FrameKind::UnsizedObject, std::move(ref)});
        return Error::Ok;

    case Type::Opaque:
    default:
        return fail(Error::UnsupportedType,
                    "Unable to encode " + value.describe() + " to ubjson");
    }
}

Error ChunkStream::step_sized_array(Frame& frame) {
    const auto& items = *frame.ref.value->get_if<Array>();
    if (frame.index == items.size()) {
        frames_.pop_back();
        return Error::Ok;
    }

    // frame is invalidated by the push below
    ValueRef child{&items[frame.index], frame.ref.owner};
    ++frame.index;
    frames_.push_back(Frame{FrameKind::Pending, std::move(child)});
    return Error::Ok;
}

Error ChunkStream::step_unsized_array(Frame& frame) {
    std::optional<Value> item = frame.ref.value->get_if<UnsizedArray>()->next();
    if (!item) {
        buffer_.append_byte(marker::END);
        frames_.pop_back();
        return Error::Ok;
    }

    auto owned = std::make_shared<const Value>(std::move(*item));
    const Value* pointer = owned.get();
    frames_.push_back(Frame{FrameKind::Pending, ValueRef{pointer, std::move(owned)}});
    return Error::Ok;
}

Error ChunkStream::step_sized_object(Frame& frame) {
    const auto& members = *frame.ref.value->get_if<Object>();

    if (!frame.expect_value) {
        if (frame.index == members.size()) {
            frames_.pop_back();
            return Error::Ok;
        }
        frame.expect_value = true;
        return encode_key(members[frame.index].first);
    }

    ValueRef child{&members[frame.index].second, frame.ref.owner};
    frame.expect_value = false;
    ++frame.index;
    frames_.push_back(Frame{FrameKind::Pending, std::move(child)});
    return Error::Ok;
}

Error ChunkStream::step_unsized_object(Frame& frame) {
    if (!frame.expect_value) {
        std::optional<Member> entry = frame.ref.value->get_if<UnsizedObject>()->next();
        if (!entry) {
            buffer_.append_byte(marker::END);
            frames_.pop_back();
            return Error::Ok;
        }
        frame.entry = std::make_shared<const Member>(std::move(*entry));
        frame.expect_value = true;
        return encode_key(frame.entry->first);
    }

    // Aliasing pointer keeps the whole entry alive while its value encodes
    std::shared_ptr<const Value> value(frame.entry, &frame.entry->second);
    frame.entry.reset();
    frame.expect_value = false;
    const Value* pointer = value.get();
    frames_.push_back(Frame{FrameKind::Pending, ValueRef{pointer, std::move(value)}});
    return Error::Ok;
}

Error ChunkStream::encode_key(const Value& key) {
    const auto* text = key.get_if<std::string>();
    if (text == nullptr) {
        return fail(Error::InvalidKey,
                    "object key should be a string, got " + key.describe());
    }
    if (encode_string(buffer_, *text) != Error::Ok) {
        return fail(Error::InvalidArg, "object key too long to encode");
    }
    return Error::Ok;
}

} // namespace ubjson
