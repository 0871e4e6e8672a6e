#include "sealdrop/format.hpp"

#include "sealdrop/base64.hpp"
#include "sealdrop/constants.hpp"
#include "sealdrop/crypto_utils.hpp"
#include "sealdrop/errors.hpp"

#include <limits>
#include <stdexcept>

namespace sealdrop::format {

namespace {

void PutU32Le(Bytes& out, std::uint32_t value) {
    out.push_back(static_cast<std::uint8_t>(value & 0xFF));
    out.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFF));
    out.push_back(static_cast<std::uint8_t>((value >> 16) & 0xFF));
    out.push_back(static_cast<std::uint8_t>((value >> 24) & 0xFF));
}

std::uint32_t GetU32Le(const std::uint8_t* ptr) {
    return static_cast<std::uint32_t>(ptr[0])
           | (static_cast<std::uint32_t>(ptr[1]) << 8)
           | (static_cast<std::uint32_t>(ptr[2]) << 16)
           | (static_cast<std::uint32_t>(ptr[3]) << 24);
}

Bytes Slice(const Bytes& data, std::size_t offset, std::size_t len) {
    return Bytes(data.begin() + static_cast<std::ptrdiff_t>(offset),
                 data.begin() + static_cast<std::ptrdiff_t>(offset + len));
}

}  // namespace

Bytes PackEnvelope(const EnvelopeParts& parts) {
    if (parts.salt.size() != constants::kSaltLen
        || parts.payload_iv.size() != constants::kPayloadIvLen
        || parts.metadata_iv.size() != constants::kMetadataIvLen) {
        throw std::invalid_argument("Envelope salt or IV has the wrong length");
    }
    if (parts.payload_iv == parts.metadata_iv) {
        throw std::invalid_argument("Envelope payload and metadata IVs must differ");
    }
    if (parts.encrypted_metadata.size() > std::numeric_limits<std::uint32_t>::max()) {
        throw std::invalid_argument("Envelope metadata too large");
    }
    Bytes out;
    out.reserve(constants::kEnvelopeHeaderLen + parts.encrypted_metadata.size() + parts.encrypted_payload.size());
    crypto::detail::AppendBytes(out, parts.salt);
    crypto::detail::AppendBytes(out, parts.payload_iv);
    crypto::detail::AppendBytes(out, parts.metadata_iv);
    PutU32Le(out, static_cast<std::uint32_t>(parts.encrypted_metadata.size()));
    crypto::detail::AppendBytes(out, parts.encrypted_metadata);
    crypto::detail::AppendBytes(out, parts.encrypted_payload);
    return out;
}

EnvelopeLayout ReadLayout(const Bytes& envelope) {
    if (envelope.size() < constants::kEnvelopeHeaderLen) {
        throw MalformedEnvelope("Envelope too short for its header");
    }
    EnvelopeLayout layout;
    layout.total_len = envelope.size();
    layout.metadata_len = GetU32Le(envelope.data() + constants::kEnvelopeHeaderLen - constants::kMetadataLengthLen);
    layout.metadata_offset = constants::kEnvelopeHeaderLen;
    if (layout.metadata_len < constants::kAeadTagLen) {
        throw MalformedEnvelope("Envelope metadata length is shorter than an authentication tag");
    }
    if (layout.metadata_len > envelope.size() - layout.metadata_offset) {
        throw MalformedEnvelope("Envelope metadata length exceeds the envelope");
    }
    layout.payload_offset = layout.metadata_offset + layout.metadata_len;
    layout.payload_len = envelope.size() - layout.payload_offset;
    if (layout.payload_len < constants::kAeadTagLen) {
        throw MalformedEnvelope("Envelope payload is shorter than an authentication tag");
    }
    return layout;
}

EnvelopeParts SplitEnvelope(const Bytes& envelope) {
    EnvelopeLayout layout = ReadLayout(envelope);
    EnvelopeParts parts;
    std::size_t offset = 0;
    parts.salt = Slice(envelope, offset, constants::kSaltLen);
    offset += constants::kSaltLen;
    parts.payload_iv = Slice(envelope, offset, constants::kPayloadIvLen);
    offset += constants::kPayloadIvLen;
    parts.metadata_iv = Slice(envelope, offset, constants::kMetadataIvLen);
    parts.encrypted_metadata = Slice(envelope, layout.metadata_offset, layout.metadata_len);
    parts.encrypted_payload = Slice(envelope, layout.payload_offset, layout.payload_len);
    return parts;
}

std::string PackName(const NameParts& parts) {
    if (parts.iv.size() != constants::kNameIvLen) {
        throw std::invalid_argument("Name IV has the wrong length");
    }
    Bytes combined;
    combined.reserve(parts.iv.size() + parts.sealed.size());
    crypto::detail::AppendBytes(combined, parts.iv);
    crypto::detail::AppendBytes(combined, parts.sealed);
    return base64::Encode(combined);
}

std::optional<NameParts> SplitName(const std::string& encoded) {
    auto combined = base64::Decode(encoded);
    if (!combined || combined->size() < constants::kNameIvLen + constants::kAeadTagLen) {
        return std::nullopt;
    }
    NameParts parts;
    parts.iv = Slice(*combined, 0, constants::kNameIvLen);
    parts.sealed = Slice(*combined, constants::kNameIvLen, combined->size() - constants::kNameIvLen);
    return parts;
}

}  // namespace sealdrop::format
