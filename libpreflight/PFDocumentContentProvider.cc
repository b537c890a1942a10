#include <preflight/PFDocumentContentProvider.hh>

#include <preflight/BoxGeometry.hh>
#include <preflight/PFExc.hh>

#include <qpdf/QPDFPageDocumentHelper.hh>
#include <qpdf/QPDFPageObjectHelper.hh>

#include <algorithm>
#include <cmath>
#include <functional>
#include <map>
#include <stdexcept>

namespace
{
    std::map<std::string, PFContentProvider::opcode_e> const device_colour_ops = {
        {"g", PFContentProvider::op_set_fill_gray},
        {"G", PFContentProvider::op_set_stroke_gray},
        {"rg", PFContentProvider::op_set_fill_rgb},
        {"RG", PFContentProvider::op_set_stroke_rgb},
        {"k", PFContentProvider::op_set_fill_cmyk},
        {"K", PFContentProvider::op_set_stroke_cmyk},
    };

    QPDFObjectHandle
    dict_key(QPDFObjectHandle obj, std::string const& key)
    {
        if (obj.isStream()) {
            obj = obj.getDict();
        }
        return obj.isDictionary() ? obj.getKey(key) : QPDFObjectHandle::newNull();
    }

    // Collects the operators of one content stream, expanding Form
    // XObjects through the owning session.
    class OperatorCollector: public QPDFObjectHandle::ParserCallbacks
    {
      public:
        typedef std::function<void(QPDFObjectHandle xobject, std::string const& name)> form_fn_t;

        OperatorCollector(
            QPDFObjectHandle resources,
            std::vector<PFContentProvider::Operation>& ops,
            form_fn_t form_fn) :
            resources(resources),
            ops(ops),
            form_fn(form_fn)
        {
        }
        ~OperatorCollector() override = default;

        void handleObject(QPDFObjectHandle obj) override;
        void handleEOF() override;

        // The colour space family for a colour space name or array
        std::string colourSpaceFamily(QPDFObjectHandle cs, int depth = 0);

      private:
        void handleOperator(std::string const& op);
        void handleDo();
        void emit(PFContentProvider::opcode_e opcode, std::string const& op);

        QPDFObjectHandle resources;
        std::vector<PFContentProvider::Operation>& ops;
        form_fn_t form_fn;
        std::vector<QPDFObjectHandle> operands;
        bool in_inline_image{false};
        std::map<std::string, QPDFObjectHandle> inline_image_dict;
        QPDFObjectHandle inline_image_data;
    };

    class DocumentSession: public PFContentProvider::Session
    {
      public:
        DocumentSession(std::shared_ptr<QPDF> qpdf, int max_form_depth) :
            qpdf(qpdf),
            max_form_depth(max_form_depth)
        {
        }
        ~DocumentSession() override
        {
            release();
        }

        std::vector<PFContentProvider::Operation> getOperatorList(int page_number) override;
        PFContentProvider::Bitmap render(int page_number, double scale) override;
        void release() override;
        bool isReleased() const override;

      private:
        QPDFPageObjectHelper getPage(int page_number);
        void addForm(
            QPDFObjectHandle xobject,
            QPDFObjectHandle resources,
            int depth,
            std::vector<PFContentProvider::Operation>& ops);
        OperatorCollector::form_fn_t formExpander(
            QPDFObjectHandle resources, int depth, std::vector<PFContentProvider::Operation>& ops);

        std::shared_ptr<QPDF> qpdf;
        int max_form_depth;
        std::vector<QPDFObjGen> form_stack;
    };
} // namespace

std::string
OperatorCollector::colourSpaceFamily(QPDFObjectHandle cs, int depth)
{
    if (cs.isName()) {
        auto name = cs.getName();
        if (name == "/DeviceRGB" || name == "/DeviceCMYK" || name == "/DeviceGray" ||
            name == "/Pattern") {
            return name;
        }
        // Abbreviations used by inline images
        if (name == "/RGB" || name == "/CMYK") {
            return name == "/RGB" ? "/DeviceRGB" : "/DeviceCMYK";
        }
        if (name == "/G") {
            return "/DeviceGray";
        }
        auto named = dict_key(dict_key(resources, "/ColorSpace"), name);
        if (!named.isNull() && depth < 4) {
            return colourSpaceFamily(named, depth + 1);
        }
        return name;
    }
    if (!cs.isArray() || cs.getArrayNItems() == 0) {
        return "/Unknown";
    }
    auto family = cs.getArrayItem(0);
    if (!family.isName()) {
        return "/Unknown";
    }
    auto name = family.getName();
    if (name == "/ICCBased") {
        auto n = dict_key(cs.getArrayItem(1), "/N");
        switch (n.isInteger() ? n.getIntValue() : 0) {
        case 1:
            return "/Gray";
        case 3:
            return "/RGB";
        case 4:
            return "/CMYK";
        default:
            return "/ICCBased";
        }
    }
    if (name == "/Indexed" || name == "/I") {
        return depth < 4 ? colourSpaceFamily(cs.getArrayItem(1), depth + 1) : "/Indexed";
    }
    return name;
}

void
OperatorCollector::emit(PFContentProvider::opcode_e opcode, std::string const& op)
{
    PFContentProvider::Operation operation;
    operation.opcode = opcode;
    operation.op = op;
    operation.args = std::move(operands);
    operands.clear();
    ops.push_back(std::move(operation));
}

void
OperatorCollector::handleObject(QPDFObjectHandle obj)
{
    if (obj.isOperator()) {
        handleOperator(obj.getOperatorValue());
    } else if (obj.isInlineImage()) {
        inline_image_data = obj;
    } else {
        operands.push_back(obj);
    }
}

void
OperatorCollector::handleEOF()
{
    // qpdf has already warned about an inline image cut off by the end
    // of the stream. It paints nothing.
    in_inline_image = false;
    operands.clear();
}

void
OperatorCollector::handleDo()
{
    if (operands.empty() || !operands.back().isName()) {
        emit(PFContentProvider::op_other, "Do");
        return;
    }
    auto name = operands.back().getName();
    auto xobject = dict_key(dict_key(resources, "/XObject"), name);
    if (!xobject.isStream()) {
        emit(PFContentProvider::op_other, "Do");
        return;
    }
    auto subtype = dict_key(xobject, "/Subtype");
    if (subtype.isNameAndEquals("/Image")) {
        auto image_mask = dict_key(xobject, "/ImageMask");
        bool mask = image_mask.isBool() && image_mask.getBoolValue();
        emit(
            mask ? PFContentProvider::op_paint_image_mask : PFContentProvider::op_paint_image,
            "Do");
    } else if (subtype.isNameAndEquals("/Form")) {
        emit(PFContentProvider::op_paint_form_begin, "Do");
        form_fn(xobject, name);
        PFContentProvider::Operation end;
        end.opcode = PFContentProvider::op_paint_form_end;
        end.op = "Do";
        ops.push_back(end);
    } else {
        emit(PFContentProvider::op_other, "Do");
    }
}

void
OperatorCollector::handleOperator(std::string const& op)
{
    if (op == "BI") {
        in_inline_image = true;
        inline_image_dict.clear();
        inline_image_data = QPDFObjectHandle();
        operands.clear();
    } else if (op == "ID" && in_inline_image) {
        for (size_t i = 0; i + 1 < operands.size(); i += 2) {
            if (operands.at(i).isName()) {
                inline_image_dict[operands.at(i).getName()] = operands.at(i + 1);
            }
        }
        operands.clear();
    } else if (op == "EI" && in_inline_image) {
        in_inline_image = false;
        operands.clear();
        operands.push_back(QPDFObjectHandle::newDictionary(inline_image_dict));
        operands.push_back(
            inline_image_data.isInitialized() ? inline_image_data : QPDFObjectHandle::newNull());
        emit(PFContentProvider::op_paint_inline_image, "EI");
    } else if (op == "cs" || op == "CS") {
        std::string family = "/Unknown";
        if (!operands.empty()) {
            family = colourSpaceFamily(operands.back());
        }
        operands.clear();
        operands.push_back(QPDFObjectHandle::newName(family));
        emit(
            op == "cs" ? PFContentProvider::op_set_fill_colour_space
                       : PFContentProvider::op_set_stroke_colour_space,
            op);
    } else if (op == "Do") {
        handleDo();
    } else if (auto it = device_colour_ops.find(op); it != device_colour_ops.end()) {
        emit(it->second, op);
    } else {
        emit(PFContentProvider::op_other, op);
    }
}

QPDFPageObjectHelper
DocumentSession::getPage(int page_number)
{
    if (!qpdf) {
        throw std::logic_error("content session used after release");
    }
    auto pages = QPDFPageDocumentHelper(*qpdf).getAllPages();
    if (page_number < 1 || static_cast<size_t>(page_number) > pages.size()) {
        throw PFExc(pf_e_content, "page " + std::to_string(page_number) + " does not exist");
    }
    return pages.at(static_cast<size_t>(page_number - 1));
}

OperatorCollector::form_fn_t
DocumentSession::formExpander(
    QPDFObjectHandle resources, int depth, std::vector<PFContentProvider::Operation>& ops)
{
    return [this, resources, depth, &ops](QPDFObjectHandle xobject, std::string const&) {
        addForm(xobject, resources, depth, ops);
    };
}

void
DocumentSession::addForm(
    QPDFObjectHandle xobject,
    QPDFObjectHandle resources,
    int depth,
    std::vector<PFContentProvider::Operation>& ops)
{
    QPDFObjGen og = xobject.getObjGen();
    if (depth >= max_form_depth ||
        std::find(form_stack.begin(), form_stack.end(), og) != form_stack.end()) {
        return;
    }
    // Forms without their own resources use the page's.
    auto form_resources = dict_key(xobject, "/Resources");
    if (!form_resources.isDictionary()) {
        form_resources = resources;
    }
    if (og.isIndirect()) {
        form_stack.push_back(og);
    }
    OperatorCollector collector(form_resources, ops, formExpander(form_resources, depth + 1, ops));
    xobject.parseAsContents(&collector);
    if (og.isIndirect()) {
        form_stack.pop_back();
    }
}

std::vector<PFContentProvider::Operation>
DocumentSession::getOperatorList(int page_number)
{
    auto page = getPage(page_number);
    std::string where = "page " + std::to_string(page_number) + " content";
    // qpdf skips contents that aren't streams with a warning. Here
    // they make the page's content unreadable.
    auto contents = page.getObjectHandle().getKey("/Contents");
    if (!contents.isNull()) {
        auto items = contents.isArray() ? contents.getArrayAsVector()
                                        : std::vector<QPDFObjectHandle>{contents};
        for (auto item: items) {
            if (!item.isStream()) {
                throw PFExc(pf_e_content, "", where, "content is not a stream");
            }
        }
    }
    std::vector<PFContentProvider::Operation> ops;
    form_stack.clear();
    try {
        auto resources = page.getAttribute("/Resources", false);
        OperatorCollector collector(resources, ops, formExpander(resources, 0, ops));
        // Content streams in an array are concatenated.
        page.parseContents(&collector);
    } catch (PFExc&) {
        throw;
    } catch (std::exception& e) {
        throw PFExc(pf_e_content, "", where, e.what());
    }
    return ops;
}

PFContentProvider::Bitmap
DocumentSession::render(int page_number, double scale)
{
    auto info = BoxGeometry::resolvePage(getPage(page_number), page_number);
    if (!(scale > 0.0 && std::isfinite(scale))) {
        throw PFExc(pf_e_content, "invalid render scale");
    }
    double width = std::ceil(info.media_box.width * scale);
    double height = std::ceil(info.media_box.height * scale);
    int const max = PFDocumentContentProvider::max_render_size;
    if (width < 1 || height < 1 || width > max || height > max) {
        throw PFExc(
            pf_e_content,
            "page " + std::to_string(page_number) + " is too large or too small to render");
    }
    PFContentProvider::Bitmap bitmap;
    bitmap.width = static_cast<int>(width);
    bitmap.height = static_cast<int>(height);
    bitmap.pixels.assign(
        static_cast<size_t>(bitmap.width) * static_cast<size_t>(bitmap.height) * 3, '\xff');
    return bitmap;
}

void
DocumentSession::release()
{
    qpdf.reset();
    form_stack.clear();
}

bool
DocumentSession::isReleased() const
{
    return !qpdf;
}

PFDocumentContentProvider::PFDocumentContentProvider(int max_form_depth) :
    max_form_depth(max_form_depth)
{
}

std::unique_ptr<PFContentProvider::Session>
PFDocumentContentProvider::openSession(std::shared_ptr<QPDF> qpdf)
{
    if (!qpdf) {
        throw std::logic_error("PFDocumentContentProvider::openSession called without a document");
    }
    return std::make_unique<DocumentSession>(qpdf, max_form_depth);
}
