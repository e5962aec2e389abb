#include "dispatch/ArgumentTransformer.hpp"

#include <exception>

namespace SF::Dispatch {

ArgumentTransformer::ArgumentTransformer(std::string name, TypeSignature source, TypeSignature target, Function function)
    : transformerName(std::move(name)), source(std::move(source)), target(std::move(target)), function(std::move(function)) {}

auto ArgumentTransformer::name() const -> std::string const& {
    return this->transformerName;
}

auto ArgumentTransformer::sourceSignature() const -> TypeSignature const& {
    return this->source;
}

auto ArgumentTransformer::targetSignature() const -> TypeSignature const& {
    return this->target;
}

auto ArgumentTransformer::supports(Receiver const& receiver, std::string_view handlerName, TypeSignature const& originalTypes) const -> bool {
    if (originalTypes != this->source)
        return false;
    return receiver.handlerTable().contains(handlerName, this->target);
}

auto ArgumentTransformer::addIfSupportedBy(Receiver const& receiver,
                                           std::string_view handlerName,
                                           TypeSignature const& originalTypes,
                                           std::vector<ArgumentTransformer const*>& candidates) const -> bool {
    if (!this->supports(receiver, handlerName, originalTypes))
        return false;
    candidates.push_back(this);
    return true;
}

auto ArgumentTransformer::transform(ArgumentList const& original) const -> Expected<ArgumentList> {
    if (signatureOf(original) != this->source) {
        return std::unexpected(Error{Error::Code::TypeMismatch,
                                     this->transformerName + " expects " + describeSignature(this->source)});
    }
    if (!this->function) {
        return std::unexpected(Error{Error::Code::TransformFailed, this->transformerName + " has no transform function"});
    }

    ArgumentList transformed;
    try {
        transformed = this->function(original);
    } catch (std::exception const& e) {
        return std::unexpected(Error{Error::Code::TransformFailed, this->transformerName + ": " + e.what()});
    }

    if (signatureOf(transformed) != this->target) {
        return std::unexpected(Error{Error::Code::TransformFailed,
                                     this->transformerName + " produced " + describeSignature(signatureOf(transformed))
                                         + " instead of " + describeSignature(this->target)});
    }
    return transformed;
}

} // namespace SF::Dispatch
