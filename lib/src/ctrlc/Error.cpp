#include <ctrlc/Error.hpp>

namespace ctrlc
{

namespace
{

class CtrlcErrorCategory final : public std::error_category
{
  public:
    [[nodiscard]] const char *name() const noexcept override { return "ctrlc"; }

    [[nodiscard]] std::string message(int ev) const override
    {
        switch (static_cast<Errc>(ev))
        {
        case Errc::AlreadyRegistered:
            return "Ctrl-C handler already registered";
        case Errc::MultipleHandlers:
            return "another signal handler is already installed";
        case Errc::TooManySubscribers:
            return "signal subscriber table is full";
        }
        return "unknown ctrlc error";
    }
};

} // namespace

const std::error_category &errorCategory() noexcept
{
    static const CtrlcErrorCategory category;
    return category;
}

} // namespace ctrlc
